/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FramePacer.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <stdexcept>

namespace RiverForge {

FramePacer::FramePacer(double targetFPS, double generationShare)
    : m_targetFPS(targetFPS)
    , m_frameTime(1.0 / targetFPS)
    , m_generationShare(std::clamp(generationShare, 0.0, 1.0))
{
    if (!(targetFPS > 0.0)) {
        throw std::invalid_argument("FramePacer target FPS must be positive");
    }
    m_frameStart = Clock::now();
    m_lastFrameStart = m_frameStart;
}

void FramePacer::startFrame() {
    const auto now = Clock::now();
    if (m_firstFrame) {
        m_firstFrame = false;
    } else {
        m_lastDeltaSeconds = std::chrono::duration<double>(now - m_lastFrameStart).count();
        updateFPS();
    }
    m_lastFrameStart = now;
    m_frameStart = now;
    ++m_frameCount;
}

double FramePacer::getGenerationBudgetMs() const {
    const double elapsedMs =
        std::chrono::duration<double, std::milli>(Clock::now() - m_frameStart).count();
    const double frameMs = m_frameTime * 1000.0;
    const double remaining = frameMs - elapsedMs;
    return std::clamp(remaining, 0.0, frameMs * m_generationShare);
}

void FramePacer::endFrame() {
    const auto targetEnd = m_frameStart + std::chrono::nanoseconds(
        static_cast<int64_t>(m_frameTime * 1e9));
    const auto remainingNs =
        std::chrono::duration_cast<std::chrono::nanoseconds>(targetEnd - Clock::now());

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

bool FramePacer::isFrameTimeExcessive() const {
    // More than 2x the target frame time
    return m_lastDeltaSeconds > m_frameTime * 2.0;
}

void FramePacer::updateFPS() {
    if (m_lastDeltaSeconds <= 0.0) {
        return;
    }
    const double instantFPS = std::clamp(1.0 / m_lastDeltaSeconds, 0.1, 1000.0);
    if (m_currentFPS <= 0.0) {
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0 - m_smoothingAlpha) * m_currentFPS;
    }
}

} // namespace RiverForge
