#pragma once

struct GLFWwindow;

class Engine;
class Renderer;

struct InputContext
{
    Engine* engine{nullptr};
    Renderer* renderer{nullptr};
    float lastX{0.0f};
    float lastY{0.0f};
    bool firstMouse{true};
    bool panning{false};
    float dollyStep{2.0f};
    float panScale{0.05f};
    float tourDistance{128.0f};
    float tourDuration{4.0f};
};

void framebufferSizeCallback(GLFWwindow* window, int width, int height);
void mouseCallback(GLFWwindow* window, double xpos, double ypos);
void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
void scrollCallback(GLFWwindow* window, double xoffset, double yoffset);
void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
