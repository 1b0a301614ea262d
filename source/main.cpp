// main.cpp
#if __has_include(<SDL2/SDL.h>)
#include <SDL2/SDL.h>
#elif __has_include(<SDL3/SDL.h>)
#include <SDL3/SDL.h>
#else
#include <SDL.h>
#endif
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#endif

#ifdef __SWITCH__
#include <switch.h>
#endif

#include "Audio.h"
#include "Game.h"
#include "Input.h"
#include "Platform.h"
#include "Projector.h"
#include "RendererGL.h"
#include "SceneRenderer.h"

struct LaunchOptions {
    int width = 800;
    int height = 600;
    bool fullscreen = false;
};

static void printUsage(const char* program) {
    std::printf("usage: %s [--width W] [--height H] [--fullscreen]\n", program);
}

static bool parseArgs(int argc, char** argv, LaunchOptions& out) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--fullscreen") == 0) {
            out.fullscreen = true;
        } else if ((std::strcmp(arg, "--width") == 0 || std::strcmp(arg, "--height") == 0) && i + 1 < argc) {
            const int value = std::atoi(argv[++i]);
            if (value <= 0) {
                std::printf("Invalid size for %s: %s\n", arg, argv[i]);
                return false;
            }
            if (arg[2] == 'w')
                out.width = value;
            else
                out.height = value;
        } else {
            std::printf("Unknown option: %s\n", arg);
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    LaunchOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argc > 0 ? argv[0] : "tankzone");
        return -1;
    }

    if (!PlatformInit()) {
        std::printf("PlatformInit failed\n");
        return -1;
    }

#ifdef __SWITCH__
    consoleDebugInit(debugDevice_SVC);
#endif

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER) != 0) {
        std::printf("SDL_Init failed: %s\n", SDL_GetError());
        PlatformShutdown();
        return -1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
#ifdef __EMSCRIPTEN__
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
#else
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
#endif

    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_RED_SIZE,   8);
    SDL_GL_SetAttribute(SDL_GL_GREEN_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_BLUE_SIZE,  8);
    SDL_GL_SetAttribute(SDL_GL_ALPHA_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 0);

    Uint32 windowFlags = SDL_WINDOW_OPENGL;
#ifdef __SWITCH__
    windowFlags |= SDL_WINDOW_FULLSCREEN;
#else
    windowFlags |= SDL_WINDOW_RESIZABLE;
    if (options.fullscreen)
        windowFlags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
#endif

    SDL_Window* window = SDL_CreateWindow(
        "TankZone",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        options.width, options.height,
        windowFlags
    );

    if (!window) {
        std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        PlatformShutdown();
        return -1;
    }

    SDL_GLContext glCtx = SDL_GL_CreateContext(window);
    if (!glCtx) {
        std::printf("SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        PlatformShutdown();
        return -1;
    }

    SDL_GL_SetSwapInterval(1); // vsync

    // Fullscreen and high-DPI windows can differ from the requested size.
    int drawW = options.width;
    int drawH = options.height;
    SDL_GL_GetDrawableSize(window, &drawW, &drawH);

    RendererGL renderer;
    RenderContext ctx;
    ctx.viewport.width = drawW;
    ctx.viewport.height = drawH;
    ctx.surface = &renderer;

    if (!renderer.init(window, drawW, drawH) || !validateRenderContext(ctx)) {
        std::printf("Renderer init failed\n");
        renderer.shutdown();
        SDL_GL_DeleteContext(glCtx);
        SDL_DestroyWindow(window);
        SDL_Quit();
        PlatformShutdown();
        return -1;
    }
    std::printf("Renderer ready: %dx%d\n", drawW, drawH);

    SDL_GameController* controller = nullptr;
    auto tryOpenController = [&]() {
        if (controller)
            return;
        for (int i = 0; i < SDL_NumJoysticks(); ++i) {
            if (SDL_IsGameController(i)) {
                SDL_GameController* opened = SDL_GameControllerOpen(i);
                if (opened) {
                    controller = opened;
                    std::printf("Controller connected: %s\n", SDL_GameControllerName(controller));
                    break;
                }
            }
        }
    };
    tryOpenController();
    if (!controller) {
        std::printf("No SDL controller detected; keyboard controls active.\n");
    }

    Audio audio;
    if (!audio.init()) {
        std::printf("Continuing without sound\n");
    }

    GameState game;
    resetGame(game);
    std::vector<RenderableEntity> renderables;

    bool running = true;
    bool fullscreen = (windowFlags & (SDL_WINDOW_FULLSCREEN | SDL_WINDOW_FULLSCREEN_DESKTOP)) != 0;
    bool firePending = false;
    uint64_t lastTicks = PlatformTicks();
    float accumulator = 0.0f;

    auto frame = [&]() {
        if (!PlatformRunning()) {
            running = false;
#ifdef __EMSCRIPTEN__
            emscripten_cancel_main_loop();
#endif
            return;
        }

        const uint64_t now = PlatformTicks();
        float dt = static_cast<float>(now - lastTicks) / 1000.0f;
        lastTicks = now;
        // Don't try to catch up after a stall (window drag, breakpoint).
        if (dt > 0.25f) dt = 0.25f;

        FrameIntents intents;

        // Attempt to hot-plug a controller each frame (needed for web Gamepad API).
        tryOpenController();

        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_WINDOWEVENT:
                    if (ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                        SDL_GL_GetDrawableSize(window, &drawW, &drawH);
                        renderer.resize(drawW, drawH);
                        ctx.viewport.width = drawW;
                        ctx.viewport.height = drawH;
                    }
                    break;
                case SDL_CONTROLLERDEVICEADDED:
                    tryOpenController();
                    break;
                case SDL_CONTROLLERDEVICEREMOVED:
                    if (controller && SDL_JoystickInstanceID(SDL_GameControllerGetJoystick(controller)) == ev.cdevice.which) {
                        SDL_GameControllerClose(controller);
                        controller = nullptr;
                        std::printf("Controller disconnected\n");
                    }
                    break;
                default:
                    handleInputEvent(ev, intents);
                    break;
            }
        }

        if (intents.quit)
            running = false;
        if (intents.toggleFullscreen) {
            fullscreen = !fullscreen;
            SDL_SetWindowFullscreen(window, fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0);
        }
        if (intents.firePressed)
            firePending = true;

        if (!running)
            return;

        if (intents.startPressed && game.phase != GamePhase::Playing) {
            pressStart(game);
            // The press that starts a round does not also fire.
            firePending = false;
            accumulator = 0.0f;
        }

        PlayerInput input;
        int16_t leftStick = 0;
        int16_t rightStick = 0;
        if (controller) {
            leftStick = SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_LEFTY);
            rightStick = SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_RIGHTY);
        }
        readTreads(SDL_GetKeyboardState(nullptr), leftStick, rightStick, input);

        accumulator += dt;
        while (accumulator >= kTickSeconds) {
            input.fire = firePending;
            firePending = false;
            stepGame(game, input);
            accumulator -= kTickSeconds;
        }

        audio.playEvents(game.sounds);
        game.sounds = SoundEvents{};
        audio.update();

        syncCamera(ctx.camera, playerPose(game));
        buildRenderables(game, renderables);

        renderer.beginFrame(ctx.style.background);
        drawGroundGrid(ctx);
        drawScene(ctx, renderables);
        renderer.drawGameHUD(game, ctx.style.accent);
        renderer.endFrame(window);
    };

#ifdef __EMSCRIPTEN__
    emscripten_set_main_loop_arg([](void* arg) {
        auto* fn = static_cast<decltype(frame)*>(arg);
        (*fn)();
    }, &frame, 0, 1);
#else
    while (running) {
        frame();
    }
#endif

    if (controller) {
        SDL_GameControllerClose(controller);
    }

    audio.shutdown();
    renderer.shutdown();
    SDL_GL_DeleteContext(glCtx);
    SDL_DestroyWindow(window);
    SDL_Quit();
    PlatformShutdown();
#ifdef __SWITCH__
    consoleExit(NULL);
#endif
    return 0;
}
