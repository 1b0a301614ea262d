// Game.cpp
#include "Game.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

float normalizeAngle(float angle) {
    while (angle > kPi) angle -= 2.0f * kPi;
    while (angle < -kPi) angle += 2.0f * kPi;
    return angle;
}

bool pointInRect(float px, float py, const Obstacle& rect) {
    return px >= rect.x && px <= rect.x + rect.width &&
           py >= rect.y && py <= rect.y + rect.height;
}

bool checkRectCollision(float x1, float y1, float w1, float h1,
                        float x2, float y2, float w2, float h2) {
    return x1 < x2 + w2 && x1 + w1 > x2 && y1 < y2 + h2 && y1 + h1 > y2;
}

bool checkCircleRectCollision(float cx, float cy, float radius, const Obstacle& rect) {
    const float closestX = std::max(rect.x, std::min(cx, rect.x + rect.width));
    const float closestY = std::max(rect.y, std::min(cy, rect.y + rect.height));
    const float dx = cx - closestX;
    const float dy = cy - closestY;
    return (dx * dx + dy * dy) < (radius * radius);
}

bool isInFieldOfView(float fromX, float fromY, float fromAngle,
                     float toX, float toY, float fovAngle) {
    const float angleToTarget = std::atan2(toY - fromY, toX - fromX);
    const float diff = normalizeAngle(angleToTarget - fromAngle);
    return std::fabs(diff) <= fovAngle * 0.5f;
}

bool hasLineOfSight(float fromX, float fromY, float fromAngle,
                    float toX, float toY, const std::vector<Obstacle>& obstacles) {
    if (!isInFieldOfView(fromX, fromY, fromAngle, toX, toY, kPi))
        return false;

    const float dx = toX - fromX;
    const float dy = toY - fromY;
    const float distance = std::hypot(dx, dy);
    if (distance < 0.1f)
        return true;

    const int steps = static_cast<int>(std::ceil(distance / kSightStep));
    for (int i = 1; i < steps; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(steps);
        const float px = fromX + dx * t;
        const float py = fromY + dy * t;
        for (const Obstacle& obs : obstacles) {
            if (pointInRect(px, py, obs))
                return false;
        }
    }
    return true;
}

bool tankBlocked(const GameState& state, float x, float y) {
    if (x < kTankSize || x > kArenaWidth - kTankSize ||
        y < kTankSize || y > kArenaHeight - kTankSize)
        return true;
    for (const Obstacle& obs : state.obstacles) {
        if (checkCircleRectCollision(x, y, kTankSize * 0.5f, obs))
            return true;
    }
    return false;
}

static void buildWalls(std::vector<Obstacle>& walls) {
    walls.clear();
    // Short blocks rather than four long slabs: a face is dropped whole when
    // any corner is behind the camera.
    const float t = kWallThickness;
    const float block = kObstacleSize;
    for (float x = 0.0f; x < kArenaWidth; x += block) {
        const float w = std::min(block, kArenaWidth - x);
        walls.push_back({ x, -t, w, t });
        walls.push_back({ x, kArenaHeight, w, t });
    }
    for (float y = 0.0f; y < kArenaHeight; y += block) {
        const float h = std::min(block, kArenaHeight - y);
        walls.push_back({ -t, y, t, h });
        walls.push_back({ kArenaWidth, y, t, h });
    }
}

void spawnEnemy(GameState& state) {
    state.enemy = Enemy{};
    state.enemy.x = kArenaWidth * 0.5f;
    state.enemy.y = 100.0f;
    state.enemy.angle = kPi * 0.5f;
}

void resetGame(GameState& state) {
    state.score = 0;
    state.enemySpeedMultiplier = 1.0f;

    state.player = Tank{};
    state.player.x = kArenaWidth * 0.5f;
    state.player.y = kArenaHeight - 100.0f;
    state.player.angle = -kPi * 0.5f;

    state.playerShell = Shell{};
    state.enemyShell = Shell{};
    state.hasLastKnown = false;
    state.particles.clear();
    state.sounds = SoundEvents{};

    state.obstacles = {
        { 200.0f, 200.0f, kObstacleSize, kObstacleSize },
        { 600.0f, 200.0f, kObstacleSize, kObstacleSize },
        { 400.0f, 350.0f, kObstacleSize, kObstacleSize },
        { 150.0f, 450.0f, kObstacleSize, kObstacleSize },
    };
    buildWalls(state.walls);

    spawnEnemy(state);
}

void pressStart(GameState& state) {
    if (state.phase == GamePhase::Playing)
        return;
    resetGame(state);
    state.phase = GamePhase::Playing;
    std::printf("Game started\n");
}

void updatePlayerMovement(GameState& state, const PlayerInput& input) {
    const int left = input.leftTread;
    const int right = input.rightTread;
    if (left == 0 && right == 0)
        return;

    Tank& p = state.player;
    const Tank old = p;

    if (left == right) {
        p.x += std::cos(p.angle) * kMoveSpeed * static_cast<float>(left);
        p.y += std::sin(p.angle) * kMoveSpeed * static_cast<float>(left);
    } else {
        p.angle += static_cast<float>(right - left) * kRotationSpeed;

        // A single driven tread pivots the hull about the idle one.
        const float oldLeftX = std::cos(old.angle + kPi * 0.5f) * kTreadPivot;
        const float oldLeftY = std::sin(old.angle + kPi * 0.5f) * kTreadPivot;
        const float newLeftX = std::cos(p.angle + kPi * 0.5f) * kTreadPivot;
        const float newLeftY = std::sin(p.angle + kPi * 0.5f) * kTreadPivot;
        if (left == 0) {
            p.x = old.x + oldLeftX - newLeftX;
            p.y = old.y + oldLeftY - newLeftY;
        } else if (right == 0) {
            p.x = old.x - oldLeftX + newLeftX;
            p.y = old.y - oldLeftY + newLeftY;
        }
    }

    if (tankBlocked(state, p.x, p.y))
        p = old;
}

static Shell makeShell(float x, float y, float angle) {
    Shell s;
    s.x = x + std::cos(angle) * kTankSize;
    s.y = y + std::sin(angle) * kTankSize;
    s.vx = std::cos(angle) * kShellSpeed;
    s.vy = std::sin(angle) * kShellSpeed;
    s.alive = true;
    return s;
}

void firePlayerShell(GameState& state) {
    if (state.playerShell.alive)
        return;
    state.playerShell = makeShell(state.player.x, state.player.y, state.player.angle);
    state.sounds.shoot = true;

    // The shot gives the player's position away.
    state.hasLastKnown = true;
    state.lastKnownX = state.player.x;
    state.lastKnownY = state.player.y;
    if (state.enemy.mode != EnemyMode::Hunting) {
        state.enemy.mode = EnemyMode::Searching;
        state.enemy.searchTimeout = kSearchTicks;
    }
}

void updateEnemy(GameState& state) {
    Enemy& e = state.enemy;
    const Tank& p = state.player;

    const bool los = hasLineOfSight(e.x, e.y, e.angle, p.x, p.y, state.obstacles);
    if (los) {
        e.mode = EnemyMode::Hunting;
        state.hasLastKnown = true;
        state.lastKnownX = p.x;
        state.lastKnownY = p.y;
        e.searchTimeout = 0;
    } else if (e.mode == EnemyMode::Hunting) {
        e.mode = EnemyMode::Searching;
        e.searchTimeout = kSearchTicks;
    }

    float targetX = e.x;
    float targetY = e.y;
    if (e.mode == EnemyMode::Hunting) {
        targetX = p.x;
        targetY = p.y;
    } else if (e.mode == EnemyMode::Searching && state.hasLastKnown) {
        targetX = state.lastKnownX;
        targetY = state.lastKnownY;

        if (std::hypot(e.x - targetX, e.y - targetY) < kTankSize * 2.0f) {
            state.hasLastKnown = false;
            e.mode = EnemyMode::Idle;
        }
        if (--e.searchTimeout <= 0) {
            state.hasLastKnown = false;
            e.mode = EnemyMode::Idle;
        }
    }

    if (e.mode != EnemyMode::Idle || targetX != e.x || targetY != e.y) {
        const float targetAngle = std::atan2(targetY - e.y, targetX - e.x);
        const float diff = normalizeAngle(targetAngle - e.angle);
        const float turn = kEnemyBaseRotationSpeed * state.enemySpeedMultiplier;
        if (std::fabs(diff) > turn)
            e.angle += (diff > 0.0f ? 1.0f : -1.0f) * turn;
        else
            e.angle = targetAngle;
    }

    if (e.mode == EnemyMode::Hunting || e.mode == EnemyMode::Searching) {
        const float oldX = e.x;
        const float oldY = e.y;
        const float speed = kEnemyBaseMoveSpeed * state.enemySpeedMultiplier;
        e.x += std::cos(e.angle) * speed;
        e.y += std::sin(e.angle) * speed;
        if (tankBlocked(state, e.x, e.y)) {
            e.x = oldX;
            e.y = oldY;
        }
    }

    --e.fireCooldown;
    if (e.mode == EnemyMode::Hunting && los && e.fireCooldown <= 0 && !state.enemyShell.alive) {
        state.enemyShell = makeShell(e.x, e.y, e.angle);
        e.fireCooldown = kEnemyFireCooldown;
        state.sounds.shoot = true;
    }
}

static void advanceShell(Shell& s) {
    if (!s.alive)
        return;
    s.x += s.vx;
    s.y += s.vy;
    if (s.x < 0.0f || s.x > kArenaWidth || s.y < 0.0f || s.y > kArenaHeight)
        s.alive = false;
}

void updateShells(GameState& state) {
    advanceShell(state.playerShell);
    advanceShell(state.enemyShell);
}

void createDebris(GameState& state, float x, float y, int count) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    for (int i = 0; i < count; ++i) {
        const float dir = unit(state.rng) * 2.0f * kPi;
        const float speed = 2.0f + unit(state.rng) * 3.0f;

        Particle p;
        p.x = x;
        p.y = y;
        p.vx = std::cos(dir) * speed;
        p.vy = std::sin(dir) * speed;
        p.angle = unit(state.rng) * 2.0f * kPi;
        p.angularVel = (unit(state.rng) - 0.5f) * 0.2f;
        p.lifetime = 60.0f + unit(state.rng) * 60.0f;
        p.length = 5.0f + unit(state.rng) * 10.0f;
        state.particles.push_back(p);
    }
}

void updateParticles(GameState& state) {
    for (Particle& p : state.particles) {
        p.x += p.vx;
        p.y += p.vy;
        p.vy += 0.15f;
        p.vx *= 0.98f;
        p.vy *= 0.98f;
        p.angle += p.angularVel;
        p.lifetime -= 1.0f;
    }
    state.particles.erase(
        std::remove_if(state.particles.begin(), state.particles.end(),
                       [](const Particle& p) { return p.lifetime <= 0.0f; }),
        state.particles.end());
}

static bool shellHitsObstacle(const Shell& s, const std::vector<Obstacle>& obstacles) {
    const float half = kShellSize * 0.5f;
    for (const Obstacle& obs : obstacles) {
        if (checkRectCollision(s.x - half, s.y - half, kShellSize, kShellSize,
                               obs.x, obs.y, obs.width, obs.height))
            return true;
    }
    return false;
}

static int debrisCount(GameState& state) {
    std::uniform_int_distribution<int> extra(0, 4);
    return 12 + extra(state.rng);
}

void checkCollisions(GameState& state) {
    if (state.playerShell.alive && shellHitsObstacle(state.playerShell, state.obstacles)) {
        state.playerShell.alive = false;
        state.sounds.impact = true;
    }
    if (state.enemyShell.alive && shellHitsObstacle(state.enemyShell, state.obstacles)) {
        state.enemyShell.alive = false;
        state.sounds.impact = true;
    }

    if (state.playerShell.alive) {
        const float d = std::hypot(state.playerShell.x - state.enemy.x,
                                   state.playerShell.y - state.enemy.y);
        if (d < kTankSize) {
            state.playerShell.alive = false;
            state.sounds.explosion = true;
            createDebris(state, state.enemy.x, state.enemy.y, debrisCount(state));
            ++state.score;
            state.enemySpeedMultiplier *= kEnemySpeedIncrease;
            std::printf("Enemy destroyed! Score: %d\n", state.score);
            spawnEnemy(state);
        }
    }

    if (state.enemyShell.alive) {
        const float d = std::hypot(state.enemyShell.x - state.player.x,
                                   state.enemyShell.y - state.player.y);
        if (d < kTankSize) {
            state.enemyShell.alive = false;
            createDebris(state, state.player.x, state.player.y, debrisCount(state));
            state.phase = GamePhase::GameOver;
            state.sounds.explosion = true;
            state.sounds.gameOver = true;
            std::printf("Player destroyed. Final score: %d\n", state.score);
        }
    }
}

void stepGame(GameState& state, const PlayerInput& input) {
    if (state.phase != GamePhase::Playing)
        return;

    if (input.fire)
        firePlayerShell(state);
    updatePlayerMovement(state, input);
    updateEnemy(state);
    updateShells(state);
    updateParticles(state);
    checkCollisions(state);
}

Pose playerPose(const GameState& state) {
    Pose pose;
    pose.x = state.player.x;
    pose.y = state.player.y;
    pose.heading = state.player.angle;
    return pose;
}

static RenderableEntity boxFor(const Obstacle& rect, float height) {
    RenderableEntity e;
    e.pose.x = rect.x + rect.width * 0.5f;
    e.pose.y = rect.y + rect.height * 0.5f;
    e.shape.kind = ShapeKind::Box;
    e.shape.box.width = rect.width;
    e.shape.box.depth = rect.height;
    e.shape.box.height = height;
    return e;
}

static RenderableEntity shellBox(const Shell& s) {
    RenderableEntity e;
    e.pose.x = s.x;
    e.pose.y = s.y;
    e.z = kShellHeight;
    e.shape.kind = ShapeKind::Box;
    e.shape.box.width = kShellBoxSize;
    e.shape.box.depth = kShellBoxSize;
    e.shape.box.height = kShellBoxSize;
    return e;
}

void buildRenderables(const GameState& state, std::vector<RenderableEntity>& out) {
    out.clear();

    for (const Obstacle& obs : state.obstacles)
        out.push_back(boxFor(obs, kObstacleHeight));
    for (const Obstacle& wall : state.walls)
        out.push_back(boxFor(wall, kWallHeight));

    RenderableEntity enemy;
    enemy.pose.x = state.enemy.x;
    enemy.pose.y = state.enemy.y;
    enemy.pose.heading = state.enemy.angle;
    enemy.shape.kind = ShapeKind::Tank;
    out.push_back(enemy);

    if (state.playerShell.alive)
        out.push_back(shellBox(state.playerShell));
    if (state.enemyShell.alive)
        out.push_back(shellBox(state.enemyShell));

    for (const Particle& p : state.particles) {
        RenderableEntity e;
        e.pose.x = p.x;
        e.pose.y = p.y;
        e.pose.heading = p.angle;
        e.z = kParticleHeight;
        e.shape.kind = ShapeKind::Point;
        e.shape.pointLength = p.length;
        e.alpha = std::min(1.0f, p.lifetime / 30.0f);
        out.push_back(e);
    }
}
