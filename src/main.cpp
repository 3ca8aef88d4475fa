#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "engine.h"
#include "engine_config.h"
#include "input_context.h"
#include "opengl/gl_atlas_backend.h"
#include "renderer.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

namespace
{
std::mutex gCrashLogMutex;
std::filesystem::path gCrashLogPath;

constexpr const char* kCrashLogName = "voxelmarch_crash.log";
constexpr const char* kConfigRelativePath = "assets/engine.toml";
constexpr double kStatsIntervalSeconds = 2.0;

void appendCrashLog(const std::string& message)
{
    if (gCrashLogPath.empty())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(gCrashLogMutex);

    std::ofstream out(gCrashLogPath, std::ios::app);
    if (!out)
    {
        return;
    }

    const std::time_t timestamp = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm timeInfo{};
#ifdef _WIN32
    localtime_s(&timeInfo, &timestamp);
#else
    localtime_r(&timestamp, &timeInfo);
#endif
    out << std::put_time(&timeInfo, "%Y-%m-%d %H:%M:%S") << " - " << message << '\n';
}

const char* signalName(int signalValue)
{
    switch (signalValue)
    {
        case SIGABRT:
            return "SIGABRT";
        case SIGSEGV:
            return "SIGSEGV";
        case SIGILL:
            return "SIGILL";
        case SIGFPE:
            return "SIGFPE";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "unknown";
    }
}

void crashSignalHandler(int signalValue)
{
    appendCrashLog(std::string("signal: ") + signalName(signalValue));
    std::_Exit(EXIT_FAILURE);
}

void initializeCrashLogging(const std::filesystem::path& logPath)
{
    gCrashLogPath = logPath;

    // Create the file up front so a crash during startup still has somewhere to go.
    {
        std::ofstream out(gCrashLogPath, std::ios::app);
    }

    for (int signalValue : {SIGABRT, SIGSEGV, SIGILL, SIGFPE, SIGTERM})
    {
        std::signal(signalValue, crashSignalHandler);
    }

    std::set_terminate([]
    {
        if (auto current = std::current_exception())
        {
            try
            {
                std::rethrow_exception(current);
            }
            catch (const std::exception& e)
            {
                appendCrashLog(std::string("terminate: ") + e.what());
            }
            catch (...)
            {
                appendCrashLog("terminate: unknown exception");
            }
        }
        else
        {
            appendCrashLog("terminate: no active exception");
        }
        std::abort();
    });
}

std::filesystem::path executableDirectory(int argc, char** argv)
{
    std::filesystem::path exePath;
    if (argc > 0 && argv[0] != nullptr)
    {
        std::error_code ec;
        exePath = std::filesystem::canonical(argv[0], ec);
        if (ec)
        {
            exePath = std::filesystem::absolute(argv[0], ec);
            if (ec)
            {
                exePath.clear();
            }
        }
    }

    std::filesystem::path directory = exePath.empty() ? exePath : exePath.parent_path();
    if (directory.empty())
    {
        directory = std::filesystem::current_path();
    }
    return directory;
}

// Explicit argument first, then the copy beside the executable, then the working directory.
std::filesystem::path resolveConfigPath(int argc, char** argv, const std::filesystem::path& exeDirectory)
{
    if (argc > 1 && argv[1] != nullptr)
    {
        return argv[1];
    }

    std::error_code ec;
    const std::filesystem::path besideExe = exeDirectory / kConfigRelativePath;
    if (std::filesystem::exists(besideExe, ec))
    {
        return besideExe;
    }
    return std::filesystem::current_path() / kConfigRelativePath;
}

std::string formatStreamingLine(const Engine& engine, double fps)
{
    const FrameStats stats = engine.collectFrameStats();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "[Engine] " << fps << " fps, "
        << static_cast<int>(stats[toIndex(FrameStat::LoadedChunks)]) << " loaded, "
        << static_cast<int>(stats[toIndex(FrameStat::PendingChunks)]) << " pending, "
        << static_cast<int>(stats[toIndex(FrameStat::CachedChunks)]) << " cached, atlas "
        << static_cast<int>(stats[toIndex(FrameStat::AtlasUsedSlots)]) << "/"
        << static_cast<int>(stats[toIndex(FrameStat::AtlasTotalSlots)]) << ", "
        << toString(engine.chunkManager().streamingState());
    return oss.str();
}

int runEngine(const EngineConfig& config)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return EXIT_FAILURE;
    }

    // Compute shaders and SSBOs need 4.3.
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(config.window.width, config.window.height, "VoxelMarch", nullptr, nullptr);
    if (window == nullptr)
    {
        std::cerr << "Failed to create GLFW window" << std::endl;
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(config.window.vsync ? 1 : 0);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }

    {
        auto backend = std::make_unique<gl::GlAtlasBackend>(config.streaming.atlasSlots);
        const gl::GlAtlasBackend& atlasBackend = *backend;

        Engine engine(config, std::move(backend));

        int framebufferWidth = 0;
        int framebufferHeight = 0;
        glfwGetFramebufferSize(window, &framebufferWidth, &framebufferHeight);
        Renderer renderer(static_cast<std::uint32_t>(std::max(framebufferWidth, 1)),
                          static_cast<std::uint32_t>(std::max(framebufferHeight, 1)),
                          engine.palette());

        InputContext inputContext;
        inputContext.engine = &engine;
        inputContext.renderer = &renderer;

        glfwSetWindowUserPointer(window, &inputContext);
        glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);
        glfwSetCursorPosCallback(window, mouseCallback);
        glfwSetMouseButtonCallback(window, mouseButtonCallback);
        glfwSetScrollCallback(window, scrollCallback);
        glfwSetKeyCallback(window, keyCallback);
        glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_DISABLED);

        double lastFrame = glfwGetTime();
        double statsTimer = 0.0;
        int framesSinceStats = 0;

        while (!glfwWindowShouldClose(window))
        {
            const double now = glfwGetTime();
            const float deltaTime = static_cast<float>(now - lastFrame);
            lastFrame = now;

            glfwPollEvents();

            engine.tick(deltaTime);
            if (engine.takeAnimationCompleted())
            {
                std::cout << "[Engine] Camera animation complete" << std::endl;
            }
            // Surface data is consumed by gameplay systems; the viewer only drains it.
            engine.drainTerrainUpdates();

            renderer.render(engine.cameraUniform(renderer.width(), renderer.height()), atlasBackend);
            glfwSwapBuffers(window);

            ++framesSinceStats;
            statsTimer += deltaTime;
            if (statsTimer >= kStatsIntervalSeconds)
            {
                std::cout << formatStreamingLine(engine, framesSinceStats / statsTimer) << std::endl;
                statsTimer = 0.0;
                framesSinceStats = 0;
            }
        }

        glfwSetWindowUserPointer(window, nullptr);
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return EXIT_SUCCESS;
}
} // namespace

int main(int argc, char** argv)
{
    const std::filesystem::path exeDirectory = executableDirectory(argc, argv);
    const std::filesystem::path logPath = exeDirectory / kCrashLogName;

#ifndef NDEBUG
    std::cout << "Crash log path: " << logPath << '\n';
#endif

    initializeCrashLogging(logPath);

    try
    {
        const EngineConfig config = EngineConfig::load(resolveConfigPath(argc, argv, exeDirectory));
        return runEngine(config);
    }
    catch (const std::exception& e)
    {
        appendCrashLog(std::string("uncaught exception: ") + e.what());
        std::cerr << "Unhandled exception: " << e.what() << '\n';
    }

    return EXIT_FAILURE;
}
