// RendererGL.h
#pragma once

#if __has_include(<SDL2/SDL.h>)
#include <SDL2/SDL.h>
#elif __has_include(<SDL3/SDL.h>)
#include <SDL3/SDL.h>
#else
#include <SDL.h>
#endif
#ifdef __SWITCH__
#include <GLES2/gl2.h>
#else
#ifndef GL_GLEXT_PROTOTYPES
#define GL_GLEXT_PROTOTYPES 1
#endif
#if __has_include(<SDL2/SDL_opengl.h>)
#include <SDL2/SDL_opengl.h>
#elif __has_include(<SDL3/SDL_opengl.h>)
#include <SDL3/SDL_opengl.h>
#else
#include <SDL_opengl.h>
#endif
#endif
#include <string>
#include "DrawSurface.h"

struct GameState;

// Flat-color 2D backend. Everything is drawn in window pixels with the
// origin at the top-left; depth testing stays off, draw order is the only
// occlusion.
class RendererGL : public DrawSurface {
public:
    RendererGL();
    ~RendererGL() override;

    bool init(SDL_Window* window, int width, int height);
    void shutdown();
    void resize(int width, int height);
    void beginFrame(const Color& clear);
    void endFrame(SDL_Window* window);

    void fillPolygon(const ScreenPoint* points, int count, const Color& color) override;
    void strokeLine(float x1, float y1, float x2, float y2,
                    const Color& color, float width) override;

    void drawQuad2D(float x, float y, float w, float h, const Color& color);
    void drawText2D(const std::string& text, float x, float y, float scale, const Color& color);
    void drawTextCentered(const std::string& text, float y, float scale, const Color& color);
    void drawGameHUD(const GameState& state, const Color& accent);

    int width() const { return m_width; }
    int height() const { return m_height; }

private:
    bool initGL();

    GLuint compileShader(GLenum type, const char* src);
    GLuint createProgram(const char* vsSrc, const char* fsSrc);

    float pixelToClipX(float x) const;
    float pixelToClipY(float y) const;
    void drawArrays2D(const float* verts, int vertexCount, GLenum primitive, const Color& color);

    int m_width;
    int m_height;

    GLuint m_program;
    GLint  m_attrPos;
    GLint  m_uniformColor;

    GLuint m_vbo;
};
