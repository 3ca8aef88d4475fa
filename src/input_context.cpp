#include "input_context.h"

#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <optional>

#include "engine.h"
#include "renderer.h"

namespace
{
InputContext* contextFor(GLFWwindow* window)
{
    auto* input = static_cast<InputContext*>(glfwGetWindowUserPointer(window));
    if (input == nullptr || input->engine == nullptr)
    {
        return nullptr;
    }
    return input;
}

std::optional<CameraIntent> intentForKey(int key)
{
    switch (key)
    {
    case GLFW_KEY_W:
        return CameraIntent::Forward;
    case GLFW_KEY_S:
        return CameraIntent::Backward;
    case GLFW_KEY_A:
        return CameraIntent::Left;
    case GLFW_KEY_D:
        return CameraIntent::Right;
    case GLFW_KEY_SPACE:
        return CameraIntent::Up;
    case GLFW_KEY_LEFT_SHIFT:
        return CameraIntent::Down;
    default:
        return std::nullopt;
    }
}
} // namespace

void framebufferSizeCallback(GLFWwindow* window, int width, int height)
{
    glViewport(0, 0, width, height);
    auto* input = static_cast<InputContext*>(glfwGetWindowUserPointer(window));
    if (input != nullptr && input->renderer != nullptr && width > 0 && height > 0)
    {
        input->renderer->resize(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height));
    }
}

void mouseCallback(GLFWwindow* window, double xpos, double ypos)
{
    InputContext* input = contextFor(window);
    if (input == nullptr)
    {
        return;
    }

    if (input->firstMouse)
    {
        input->lastX = static_cast<float>(xpos);
        input->lastY = static_cast<float>(ypos);
        input->firstMouse = false;
    }

    const float xoffset = static_cast<float>(xpos) - input->lastX;
    const float yoffset = input->lastY - static_cast<float>(ypos);

    input->lastX = static_cast<float>(xpos);
    input->lastY = static_cast<float>(ypos);

    if (input->panning)
    {
        input->engine->applyPan(-xoffset * input->panScale, -yoffset * input->panScale);
    }
    else
    {
        input->engine->applyLookDelta(xoffset, yoffset);
    }
}

void mouseButtonCallback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    InputContext* input = contextFor(window);
    if (input == nullptr)
    {
        return;
    }

    if (button == GLFW_MOUSE_BUTTON_RIGHT)
    {
        input->panning = (action == GLFW_PRESS);
    }
}

void scrollCallback(GLFWwindow* window, double /*xoffset*/, double yoffset)
{
    InputContext* input = contextFor(window);
    if (input == nullptr)
    {
        return;
    }
    input->engine->applyDolly(static_cast<float>(yoffset) * input->dollyStep);
}

void keyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    InputContext* input = contextFor(window);
    if (input == nullptr || action == GLFW_REPEAT)
    {
        return;
    }

    if (const std::optional<CameraIntent> intent = intentForKey(key))
    {
        if (action == GLFW_PRESS)
        {
            input->engine->beginIntent(*intent);
        }
        else
        {
            input->engine->endIntent(*intent);
        }
        return;
    }

    if (action != GLFW_PRESS)
    {
        return;
    }

    Engine& engine = *input->engine;
    switch (key)
    {
    case GLFW_KEY_ESCAPE:
        glfwSetWindowShouldClose(window, GLFW_TRUE);
        break;
    case GLFW_KEY_R:
        engine.setCamera(engine.config().camera.initialPose);
        break;
    case GLFW_KEY_T:
    {
        // Fly forward along the view; the destination is preloaded while the camera travels.
        CameraPose target = engine.camera().pose();
        target.position += engine.camera().front() * input->tourDistance;
        engine.preloadView(target.position);
        engine.animateCamera(target, input->tourDuration, Easing::SineInOut);
        break;
    }
    case GLFW_KEY_O:
        engine.lookAt(glm::vec3(0.0f, static_cast<float>(engine.config().worldgen.baseHeight), 0.0f));
        break;
    default:
        break;
    }
}
