// RendererGL.cpp
#include "RendererGL.h"
#include "GameState.h"
#include <cmath>
#include <cstdio>
#include <vector>
#include <array>
#include <cctype>
#include <cstdint>

#if !defined(__SWITCH__) && !defined(__EMSCRIPTEN__)
// Desktop opengl32 only exports 1.1 entry points; the shader path is looked up
// through SDL.
static PFNGLDELETEBUFFERSPROC p_glDeleteBuffers = nullptr;
static PFNGLDELETEPROGRAMPROC p_glDeleteProgram = nullptr;
static PFNGLUSEPROGRAMPROC p_glUseProgram = nullptr;
static PFNGLUNIFORM4FPROC p_glUniform4f = nullptr;
static PFNGLBINDBUFFERPROC p_glBindBuffer = nullptr;
static PFNGLBUFFERDATAPROC p_glBufferData = nullptr;
static PFNGLENABLEVERTEXATTRIBARRAYPROC p_glEnableVertexAttribArray = nullptr;
static PFNGLVERTEXATTRIBPOINTERPROC p_glVertexAttribPointer = nullptr;
static PFNGLDISABLEVERTEXATTRIBARRAYPROC p_glDisableVertexAttribArray = nullptr;
static PFNGLCREATESHADERPROC p_glCreateShader = nullptr;
static PFNGLSHADERSOURCEPROC p_glShaderSource = nullptr;
static PFNGLCOMPILESHADERPROC p_glCompileShader = nullptr;
static PFNGLGETSHADERIVPROC p_glGetShaderiv = nullptr;
static PFNGLGETSHADERINFOLOGPROC p_glGetShaderInfoLog = nullptr;
static PFNGLDELETESHADERPROC p_glDeleteShader = nullptr;
static PFNGLCREATEPROGRAMPROC p_glCreateProgram = nullptr;
static PFNGLATTACHSHADERPROC p_glAttachShader = nullptr;
static PFNGLLINKPROGRAMPROC p_glLinkProgram = nullptr;
static PFNGLGETPROGRAMIVPROC p_glGetProgramiv = nullptr;
static PFNGLGETPROGRAMINFOLOGPROC p_glGetProgramInfoLog = nullptr;
static PFNGLGETATTRIBLOCATIONPROC p_glGetAttribLocation = nullptr;
static PFNGLGETUNIFORMLOCATIONPROC p_glGetUniformLocation = nullptr;
static PFNGLGENBUFFERSPROC p_glGenBuffers = nullptr;

#define glDeleteBuffers p_glDeleteBuffers
#define glDeleteProgram p_glDeleteProgram
#define glUseProgram p_glUseProgram
#define glUniform4f p_glUniform4f
#define glBindBuffer p_glBindBuffer
#define glBufferData p_glBufferData
#define glEnableVertexAttribArray p_glEnableVertexAttribArray
#define glVertexAttribPointer p_glVertexAttribPointer
#define glDisableVertexAttribArray p_glDisableVertexAttribArray
#define glCreateShader p_glCreateShader
#define glShaderSource p_glShaderSource
#define glCompileShader p_glCompileShader
#define glGetShaderiv p_glGetShaderiv
#define glGetShaderInfoLog p_glGetShaderInfoLog
#define glDeleteShader p_glDeleteShader
#define glCreateProgram p_glCreateProgram
#define glAttachShader p_glAttachShader
#define glLinkProgram p_glLinkProgram
#define glGetProgramiv p_glGetProgramiv
#define glGetProgramInfoLog p_glGetProgramInfoLog
#define glGetAttribLocation p_glGetAttribLocation
#define glGetUniformLocation p_glGetUniformLocation
#define glGenBuffers p_glGenBuffers

static bool loadGLFunctions() {
    p_glDeleteBuffers            = reinterpret_cast<PFNGLDELETEBUFFERSPROC>(SDL_GL_GetProcAddress("glDeleteBuffers"));
    p_glDeleteProgram            = reinterpret_cast<PFNGLDELETEPROGRAMPROC>(SDL_GL_GetProcAddress("glDeleteProgram"));
    p_glUseProgram               = reinterpret_cast<PFNGLUSEPROGRAMPROC>(SDL_GL_GetProcAddress("glUseProgram"));
    p_glUniform4f                = reinterpret_cast<PFNGLUNIFORM4FPROC>(SDL_GL_GetProcAddress("glUniform4f"));
    p_glBindBuffer               = reinterpret_cast<PFNGLBINDBUFFERPROC>(SDL_GL_GetProcAddress("glBindBuffer"));
    p_glBufferData               = reinterpret_cast<PFNGLBUFFERDATAPROC>(SDL_GL_GetProcAddress("glBufferData"));
    p_glEnableVertexAttribArray  = reinterpret_cast<PFNGLENABLEVERTEXATTRIBARRAYPROC>(SDL_GL_GetProcAddress("glEnableVertexAttribArray"));
    p_glVertexAttribPointer      = reinterpret_cast<PFNGLVERTEXATTRIBPOINTERPROC>(SDL_GL_GetProcAddress("glVertexAttribPointer"));
    p_glDisableVertexAttribArray = reinterpret_cast<PFNGLDISABLEVERTEXATTRIBARRAYPROC>(SDL_GL_GetProcAddress("glDisableVertexAttribArray"));
    p_glCreateShader             = reinterpret_cast<PFNGLCREATESHADERPROC>(SDL_GL_GetProcAddress("glCreateShader"));
    p_glShaderSource             = reinterpret_cast<PFNGLSHADERSOURCEPROC>(SDL_GL_GetProcAddress("glShaderSource"));
    p_glCompileShader            = reinterpret_cast<PFNGLCOMPILESHADERPROC>(SDL_GL_GetProcAddress("glCompileShader"));
    p_glGetShaderiv              = reinterpret_cast<PFNGLGETSHADERIVPROC>(SDL_GL_GetProcAddress("glGetShaderiv"));
    p_glGetShaderInfoLog         = reinterpret_cast<PFNGLGETSHADERINFOLOGPROC>(SDL_GL_GetProcAddress("glGetShaderInfoLog"));
    p_glDeleteShader             = reinterpret_cast<PFNGLDELETESHADERPROC>(SDL_GL_GetProcAddress("glDeleteShader"));
    p_glCreateProgram            = reinterpret_cast<PFNGLCREATEPROGRAMPROC>(SDL_GL_GetProcAddress("glCreateProgram"));
    p_glAttachShader             = reinterpret_cast<PFNGLATTACHSHADERPROC>(SDL_GL_GetProcAddress("glAttachShader"));
    p_glLinkProgram              = reinterpret_cast<PFNGLLINKPROGRAMPROC>(SDL_GL_GetProcAddress("glLinkProgram"));
    p_glGetProgramiv             = reinterpret_cast<PFNGLGETPROGRAMIVPROC>(SDL_GL_GetProcAddress("glGetProgramiv"));
    p_glGetProgramInfoLog        = reinterpret_cast<PFNGLGETPROGRAMINFOLOGPROC>(SDL_GL_GetProcAddress("glGetProgramInfoLog"));
    p_glGetAttribLocation        = reinterpret_cast<PFNGLGETATTRIBLOCATIONPROC>(SDL_GL_GetProcAddress("glGetAttribLocation"));
    p_glGetUniformLocation       = reinterpret_cast<PFNGLGETUNIFORMLOCATIONPROC>(SDL_GL_GetProcAddress("glGetUniformLocation"));
    p_glGenBuffers               = reinterpret_cast<PFNGLGENBUFFERSPROC>(SDL_GL_GetProcAddress("glGenBuffers"));

    return p_glDeleteBuffers && p_glDeleteProgram && p_glUseProgram && p_glUniform4f &&
           p_glBindBuffer && p_glBufferData && p_glEnableVertexAttribArray && p_glVertexAttribPointer &&
           p_glDisableVertexAttribArray && p_glCreateShader && p_glShaderSource && p_glCompileShader &&
           p_glGetShaderiv && p_glGetShaderInfoLog && p_glDeleteShader && p_glCreateProgram &&
           p_glAttachShader && p_glLinkProgram && p_glGetProgramiv && p_glGetProgramInfoLog &&
           p_glGetAttribLocation && p_glGetUniformLocation && p_glGenBuffers;
}
#else
static bool loadGLFunctions() { return true; }
#endif

// Triangulates a simple polygon given in either winding. Returns false when
// no ear can be found (self-intersecting or degenerate input).
static bool earClip(const ScreenPoint* poly, int count, std::vector<int>& out) {
    if (count < 3) return false;
    float area = 0.0f;
    for (int i = 0; i < count; ++i) {
        const ScreenPoint& a = poly[i];
        const ScreenPoint& b = poly[(i + 1) % count];
        area += (a.x * b.y - b.x * a.y);
    }
    const bool clockwise = area < 0.0f;

    std::vector<int> remaining;
    remaining.reserve(count);
    for (int i = 0; i < count; ++i)
        remaining.push_back(i);

    while (remaining.size() >= 3) {
        const size_t n = remaining.size();
        bool clipped = false;
        for (size_t i = 0; i < n; ++i) {
            const int i0 = remaining[(i + n - 1) % n];
            const int i1 = remaining[i];
            const int i2 = remaining[(i + 1) % n];
            const ScreenPoint& a = poly[i0];
            const ScreenPoint& b = poly[i1];
            const ScreenPoint& c = poly[i2];
            const float turn = (b.x - a.x) * (c.y - b.y) - (b.y - a.y) * (c.x - b.x);
            if (clockwise ? turn > -1e-5f : turn < 1e-5f) continue;

            bool ear = true;
            for (int k : remaining) {
                if (k == i0 || k == i1 || k == i2) continue;
                const ScreenPoint& p = poly[k];
                const float w1 = (a.x - p.x) * (b.y - a.y) - (a.y - p.y) * (b.x - a.x);
                const float w2 = (b.x - p.x) * (c.y - b.y) - (b.y - p.y) * (c.x - b.x);
                const float w3 = (c.x - p.x) * (a.y - c.y) - (c.y - p.y) * (a.x - c.x);
                if (clockwise ? (w1 <= 0 && w2 <= 0 && w3 <= 0) : (w1 >= 0 && w2 >= 0 && w3 >= 0)) {
                    ear = false;
                    break;
                }
            }
            if (ear) {
                out.push_back(i0);
                out.push_back(i1);
                out.push_back(i2);
                remaining.erase(remaining.begin() + static_cast<long>(i));
                clipped = true;
                break;
            }
        }
        if (!clipped) return false;
    }
    return true;
}

static bool getGlyph(char c, std::array<uint8_t, 5>& out) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'A': out = {0x7E,0x11,0x11,0x11,0x7E}; return true;
        case 'B': out = {0x7F,0x49,0x49,0x49,0x36}; return true;
        case 'C': out = {0x3E,0x41,0x41,0x41,0x22}; return true;
        case 'D': out = {0x7F,0x41,0x41,0x22,0x1C}; return true;
        case 'E': out = {0x7F,0x49,0x49,0x49,0x41}; return true;
        case 'F': out = {0x7F,0x09,0x09,0x09,0x01}; return true;
        case 'G': out = {0x3E,0x41,0x49,0x49,0x7A}; return true;
        case 'H': out = {0x7F,0x08,0x08,0x08,0x7F}; return true;
        case 'I': out = {0x00,0x41,0x7F,0x41,0x00}; return true;
        case 'J': out = {0x20,0x40,0x41,0x3F,0x01}; return true;
        case 'K': out = {0x7F,0x08,0x14,0x22,0x41}; return true;
        case 'L': out = {0x7F,0x40,0x40,0x40,0x40}; return true;
        case 'M': out = {0x7F,0x02,0x0C,0x02,0x7F}; return true;
        case 'N': out = {0x7F,0x04,0x08,0x10,0x7F}; return true;
        case 'O': out = {0x3E,0x41,0x41,0x41,0x3E}; return true;
        case 'P': out = {0x7F,0x09,0x09,0x09,0x06}; return true;
        case 'Q': out = {0x3E,0x41,0x51,0x21,0x5E}; return true;
        case 'R': out = {0x7F,0x09,0x19,0x29,0x46}; return true;
        case 'S': out = {0x26,0x49,0x49,0x49,0x32}; return true;
        case 'T': out = {0x01,0x01,0x7F,0x01,0x01}; return true;
        case 'U': out = {0x3F,0x40,0x40,0x40,0x3F}; return true;
        case 'V': out = {0x1F,0x20,0x40,0x20,0x1F}; return true;
        case 'W': out = {0x7F,0x20,0x18,0x20,0x7F}; return true;
        case 'X': out = {0x63,0x14,0x08,0x14,0x63}; return true;
        case 'Y': out = {0x03,0x04,0x78,0x04,0x03}; return true;
        case 'Z': out = {0x61,0x51,0x49,0x45,0x43}; return true;
        case '0': out = {0x3E,0x45,0x49,0x51,0x3E}; return true;
        case '1': out = {0x00,0x42,0x7F,0x40,0x00}; return true;
        case '2': out = {0x62,0x51,0x49,0x45,0x42}; return true;
        case '3': out = {0x22,0x41,0x49,0x49,0x36}; return true;
        case '4': out = {0x1C,0x12,0x7F,0x10,0x10}; return true;
        case '5': out = {0x27,0x45,0x45,0x45,0x39}; return true;
        case '6': out = {0x3E,0x49,0x49,0x49,0x32}; return true;
        case '7': out = {0x01,0x01,0x7D,0x03,0x01}; return true;
        case '8': out = {0x36,0x49,0x49,0x49,0x36}; return true;
        case '9': out = {0x26,0x49,0x49,0x49,0x3E}; return true;
        case ':': out = {0x00,0x36,0x36,0x00,0x00}; return true;
        case '.': out = {0x00,0x60,0x60,0x00,0x00}; return true;
        case ',': out = {0x00,0x40,0x60,0x00,0x00}; return true;
        case '(': out = {0x00,0x1C,0x22,0x41,0x00}; return true;
        case ')': out = {0x00,0x41,0x22,0x1C,0x00}; return true;
        case '-': out = {0x08,0x08,0x08,0x08,0x08}; return true;
        case '+': out = {0x08,0x08,0x3E,0x08,0x08}; return true;
        case '/': out = {0x40,0x30,0x0C,0x03,0x00}; return true;
        case '!': out = {0x00,0x00,0x5F,0x00,0x00}; return true;
        case ' ': out = {0x00,0x00,0x00,0x00,0x00}; return true;
        default: out = {0x00,0x00,0x00,0x00,0x00}; return true;
    }
}

RendererGL::RendererGL()
    : m_width(800)
    , m_height(600)
    , m_program(0)
    , m_attrPos(-1)
    , m_uniformColor(-1)
    , m_vbo(0)
{
}

RendererGL::~RendererGL() {
    shutdown();
}

// Needs the GL context that init() ran on; call before deleting it.
void RendererGL::shutdown() {
    if (m_vbo) glDeleteBuffers(1, &m_vbo);
    if (m_program) glDeleteProgram(m_program);
    m_vbo = 0;
    m_program = 0;
}

bool RendererGL::init(SDL_Window* window, int width, int height) {
    if (!window) {
        std::printf("RendererGL::init called with null window\n");
        return false;
    }

    if (!loadGLFunctions()) {
        std::printf("Failed to load desktop GL functions\n");
        return false;
    }

    if (!initGL())
        return false;

    glGenBuffers(1, &m_vbo);
    if (!m_vbo) {
        std::printf("Failed to create vertex buffer\n");
        return false;
    }

    resize(width, height);
    return true;
}

void RendererGL::resize(int width, int height) {
    m_width = width;
    m_height = height;
    glViewport(0, 0, width, height);
}

void RendererGL::beginFrame(const Color& clear) {
    glClearColor(clear.r, clear.g, clear.b, 1.0f);
    glDisable(GL_DEPTH_TEST);
    glClear(GL_COLOR_BUFFER_BIT);
}

void RendererGL::endFrame(SDL_Window* window) {
    SDL_GL_SwapWindow(window);
}

float RendererGL::pixelToClipX(float x) const {
    return x / (static_cast<float>(m_width) * 0.5f) - 1.0f;
}

float RendererGL::pixelToClipY(float y) const {
    return 1.0f - y / (static_cast<float>(m_height) * 0.5f);
}

void RendererGL::drawArrays2D(const float* verts, int vertexCount, GLenum primitive, const Color& color) {
    if (vertexCount <= 0)
        return;

    glUseProgram(m_program);
    glUniform4f(m_uniformColor, color.r, color.g, color.b, color.a);

    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(float) * 2 * vertexCount, verts, GL_DYNAMIC_DRAW);

    glEnableVertexAttribArray(m_attrPos);
    glVertexAttribPointer(m_attrPos, 2, GL_FLOAT, GL_FALSE, sizeof(float) * 2, (const void*)0);

    glDrawArrays(primitive, 0, vertexCount);

    glDisableVertexAttribArray(m_attrPos);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void RendererGL::fillPolygon(const ScreenPoint* points, int count, const Color& color) {
    if (!points || count < 3 || m_width <= 0 || m_height <= 0)
        return;

    std::vector<int> triIdx;
    std::vector<float> verts;
    GLenum primitive = GL_TRIANGLES;
    if (earClip(points, count, triIdx) && !triIdx.empty()) {
        verts.reserve(triIdx.size() * 2);
        for (int i : triIdx) {
            verts.push_back(pixelToClipX(points[i].x));
            verts.push_back(pixelToClipY(points[i].y));
        }
    } else {
        // Projected quads can come out bow-tied; a fan still covers them.
        primitive = GL_TRIANGLE_FAN;
        verts.reserve(static_cast<size_t>(count) * 2);
        for (int i = 0; i < count; ++i) {
            verts.push_back(pixelToClipX(points[i].x));
            verts.push_back(pixelToClipY(points[i].y));
        }
    }

    drawArrays2D(verts.data(), static_cast<int>(verts.size() / 2), primitive, color);
}

void RendererGL::strokeLine(float x1, float y1, float x2, float y2,
                            const Color& color, float width) {
    if (m_width <= 0 || m_height <= 0 || width <= 0.0f)
        return;

    const float verts[4] = {
        pixelToClipX(x1), pixelToClipY(y1),
        pixelToClipX(x2), pixelToClipY(y2),
    };

    glLineWidth(width);
    drawArrays2D(verts, 2, GL_LINES, color);
}

// ===== internal helpers =====

bool RendererGL::initGL() {
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    const char* vsSrc =
        "attribute vec2 aPos;\n"
        "void main() {\n"
        "    gl_Position = vec4(aPos, 0.0, 1.0);\n"
        "}\n";

    const char* fsSrc =
        "#ifdef GL_ES\n"
        "precision mediump float;\n"
        "#endif\n"
        "uniform vec4 uColor;\n"
        "void main() {\n"
        "    gl_FragColor = uColor;\n"
        "}\n";

    m_program = createProgram(vsSrc, fsSrc);
    if (!m_program) {
        std::printf("Failed to create GL program\n");
        return false;
    }

    m_attrPos = glGetAttribLocation(m_program, "aPos");
    m_uniformColor = glGetUniformLocation(m_program, "uColor");

    if (m_attrPos < 0 || m_uniformColor < 0) {
        std::printf("Failed to get shader locations\n");
        return false;
    }
    return true;
}

GLuint RendererGL::compileShader(GLenum type, const char* src) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint ok = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[512];
        glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
        std::printf("Shader compile error: %s\n", log);
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

GLuint RendererGL::createProgram(const char* vsSrc, const char* fsSrc) {
    GLuint vs = compileShader(GL_VERTEX_SHADER, vsSrc);
    if (!vs) return 0;

    GLuint fs = compileShader(GL_FRAGMENT_SHADER, fsSrc);
    if (!fs) {
        glDeleteShader(vs);
        return 0;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);

    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint ok = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[512];
        glGetProgramInfoLog(program, sizeof(log), nullptr, log);
        std::printf("Program link error: %s\n", log);
        glDeleteProgram(program);
        return 0;
    }
    return program;
}

void RendererGL::drawQuad2D(float x, float y, float w, float h, const Color& color) {
    if (w <= 0.0f || h <= 0.0f || m_width <= 0 || m_height <= 0)
        return;

    const float x0 = pixelToClipX(x);
    const float y0 = pixelToClipY(y);
    const float x1 = pixelToClipX(x + w);
    const float y1 = pixelToClipY(y + h);

    const float verts[8] = {
        x0, y0,
        x1, y0,
        x1, y1,
        x0, y1
    };
    drawArrays2D(verts, 4, GL_TRIANGLE_FAN, color);
}

void RendererGL::drawText2D(const std::string& text, float x, float y, float scale, const Color& color) {
    float cursorX = x;
    const float advance = 6.0f * scale;
    for (char c : text) {
        std::array<uint8_t, 5> glyph{};
        if (!getGlyph(c, glyph))
            continue;
        for (int col = 0; col < 5; ++col) {
            const uint8_t bits = glyph[col];
            for (int row = 0; row < 7; ++row) {
                if (bits & (1u << row)) {
                    drawQuad2D(cursorX + static_cast<float>(col) * scale,
                               y + static_cast<float>(row) * scale,
                               scale, scale, color);
                }
            }
        }
        cursorX += advance;
    }
}

void RendererGL::drawTextCentered(const std::string& text, float y, float scale, const Color& color) {
    // Last glyph has no trailing gap.
    const float textWidth = static_cast<float>(text.size()) * 6.0f * scale - scale;
    drawText2D(text, (static_cast<float>(m_width) - textWidth) * 0.5f, y, scale, color);
}

void RendererGL::drawGameHUD(const GameState& state, const Color& accent) {
    if (m_width <= 0 || m_height <= 0)
        return;

    const Color white{ 1.0f, 1.0f, 1.0f, 1.0f };
    const float midY = static_cast<float>(m_height) * 0.5f;
    char buf[64];

    switch (state.phase) {
        case GamePhase::Playing:
            std::snprintf(buf, sizeof(buf), "SCORE: %d", state.score);
            drawText2D(buf, 12.0f, 12.0f, 3.0f, accent);
            break;
        case GamePhase::Start:
            drawTextCentered("TANKZONE", midY - 90.0f, 8.0f, accent);
            drawTextCentered("Q/A LEFT TREAD   W/S RIGHT TREAD", midY + 10.0f, 2.0f, white);
            drawTextCentered("SPACE FIRE", midY + 35.0f, 2.0f, white);
            drawTextCentered("PRESS SPACE TO START", midY + 80.0f, 3.0f, accent);
            break;
        case GamePhase::GameOver: {
            const Color shade{ 0.0f, 0.0f, 0.0f, 0.6f };
            drawQuad2D(0.0f, 0.0f, static_cast<float>(m_width), static_cast<float>(m_height), shade);
            drawTextCentered("GAME OVER", midY - 70.0f, 7.0f, accent);
            std::snprintf(buf, sizeof(buf), "FINAL SCORE: %d", state.score);
            drawTextCentered(buf, midY + 10.0f, 3.0f, white);
            drawTextCentered("PRESS SPACE TO RESTART", midY + 60.0f, 3.0f, accent);
            break;
        }
    }
}
