/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FRAME_PACER_HPP
#define FRAME_PACER_HPP

#include <chrono>
#include <cstdint>

namespace RiverForge {

/**
 * FramePacer drives the demo loop at a fixed update rate.
 *
 * Each frame gets exactly one fixed-timestep update. Whatever is left of the
 * frame after the update is handed to terrain generation as its budget, and
 * endFrame() sleeps off the remainder with SDL_DelayPrecise.
 */
class FramePacer {
public:
    /**
     * @param targetFPS frames per second (e.g., 60.0)
     * @param generationShare fraction of the frame offered to chunk generation
     */
    explicit FramePacer(double targetFPS = 60.0, double generationShare = 0.5);

    // Call at the start of each frame
    void startFrame();

    // Fixed delta time in seconds
    double getDeltaTime() const { return m_frameTime; }

    /**
     * Milliseconds of this frame still available for generation work.
     * Never more than generationShare of the frame.
     */
    double getGenerationBudgetMs() const;

    // Sleeps until the frame's target end time
    void endFrame();

    double getTargetFPS() const { return m_targetFPS; }
    double getCurrentFPS() const { return m_currentFPS; }
    uint64_t getFrameCount() const { return m_frameCount; }
    bool isFrameTimeExcessive() const;

private:
    using Clock = std::chrono::steady_clock;

    double m_targetFPS;
    double m_frameTime;            // seconds
    double m_generationShare;
    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameStart;
    double m_lastDeltaSeconds{0.0};
    double m_currentFPS{0.0};
    double m_smoothingAlpha{0.05};
    uint64_t m_frameCount{0};
    bool m_firstFrame{true};

    void updateFPS();
};

} // namespace RiverForge

#endif // FRAME_PACER_HPP
