// Game.h
#pragma once

#include <vector>
#include "Geometry.h"
#include "GameState.h"

float normalizeAngle(float angle);

bool pointInRect(float px, float py, const Obstacle& rect);
bool checkRectCollision(float x1, float y1, float w1, float h1,
                        float x2, float y2, float w2, float h2);
bool checkCircleRectCollision(float cx, float cy, float radius, const Obstacle& rect);

// Target within fovAngle (full arc) centred on fromAngle.
bool isInFieldOfView(float fromX, float fromY, float fromAngle,
                     float toX, float toY, float fovAngle);

// Forward 180 degree arc, then a ray sampled every kSightStep units that
// must not enter any obstacle.
bool hasLineOfSight(float fromX, float fromY, float fromAngle,
                    float toX, float toY, const std::vector<Obstacle>& obstacles);

bool tankBlocked(const GameState& state, float x, float y);

void resetGame(GameState& state);
void spawnEnemy(GameState& state);

// Start or restart from the title / game-over screens.
void pressStart(GameState& state);

void updatePlayerMovement(GameState& state, const PlayerInput& input);
void firePlayerShell(GameState& state);
void updateEnemy(GameState& state);
void updateShells(GameState& state);
void updateParticles(GameState& state);
void checkCollisions(GameState& state);
void createDebris(GameState& state, float x, float y, int count);

// One simulation tick; does nothing outside GamePhase::Playing.
void stepGame(GameState& state, const PlayerInput& input);

Pose playerPose(const GameState& state);

// Obstacles, walls, enemy tank, shells and debris as renderer input.
void buildRenderables(const GameState& state, std::vector<RenderableEntity>& out);
