#pragma once
// Copyright (c) 2025, WH, All rights reserved.

#include <glm/vec2.hpp>
#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include <numbers>

using vec2 = glm::vec2;

inline constexpr float PI = std::numbers::pi_v<float>;
