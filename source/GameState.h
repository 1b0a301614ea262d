// GameState.h
#pragma once

#include <cstdint>
#include <random>
#include <vector>

// Simulation runs in fixed 60 Hz ticks; speeds are per tick.
constexpr float kArenaWidth = 800.0f;
constexpr float kArenaHeight = 600.0f;
constexpr float kTankSize = 30.0f;
constexpr float kShellSize = 20.0f;
constexpr float kObstacleSize = 40.0f;
constexpr float kObstacleHeight = 40.0f;
constexpr float kRotationSpeed = 0.007f;
constexpr float kMoveSpeed = 0.7f;
constexpr float kTreadPivot = 10.0f;
constexpr float kShellSpeed = 2.1f;
constexpr float kEnemyBaseMoveSpeed = 0.175f;
constexpr float kEnemyBaseRotationSpeed = 0.0028f;
constexpr int   kEnemyFireCooldown = 120;
constexpr float kEnemySpeedIncrease = 1.1f;
constexpr int   kSearchTicks = 300;
constexpr float kSightStep = 5.0f;
constexpr float kShellBoxSize = 8.0f;
constexpr float kShellHeight = 5.0f;
constexpr float kParticleHeight = 5.0f;
constexpr float kWallHeight = 12.0f;
constexpr float kWallThickness = 6.0f;
constexpr float kTickSeconds = 1.0f / 60.0f;

enum class GamePhase {
    Start,
    Playing,
    GameOver
};

enum class EnemyMode {
    Idle,
    Hunting,
    Searching
};

struct Tank {
    float x = 0.0f;
    float y = 0.0f;
    float angle = 0.0f;
};

struct Enemy {
    float x = 0.0f;
    float y = 0.0f;
    float angle = 0.0f;
    int fireCooldown = kEnemyFireCooldown;
    EnemyMode mode = EnemyMode::Idle;
    int searchTimeout = 0;
};

struct Shell {
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
    bool alive = false;
};

// Axis-aligned rectangle, (x, y) is the minimum corner.
struct Obstacle {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

struct Particle {
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
    float angle = 0.0f;
    float angularVel = 0.0f;
    float lifetime = 0.0f;
    float length = 0.0f;
};

// Tread force is -1, 0 or +1 per side.
struct PlayerInput {
    int leftTread = 0;
    int rightTread = 0;
    bool fire = false;
};

// Raised by the simulation when something audible happens. The frontend
// plays them and clears the flags.
struct SoundEvents {
    bool shoot = false;
    bool explosion = false;
    bool impact = false;
    bool gameOver = false;
};

struct GameState {
    GamePhase phase = GamePhase::Start;
    int score = 0;
    float enemySpeedMultiplier = 1.0f;
    Tank player;
    Enemy enemy;
    bool hasLastKnown = false;
    float lastKnownX = 0.0f;
    float lastKnownY = 0.0f;
    Shell playerShell;
    Shell enemyShell;
    std::vector<Obstacle> obstacles;
    std::vector<Obstacle> walls;
    std::vector<Particle> particles;
    SoundEvents sounds;
    std::mt19937 rng{ 0x7a4bu };
};
