/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decoration/Fitness.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace RiverForge {

namespace {

constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

double smoothstep(double edge0, double edge1, double x) {
    if (edge1 <= edge0) {
        return x < edge0 ? 0.0 : 1.0;
    }
    const double t = std::clamp((x - edge0) / (edge1 - edge0), 0.0, 1.0);
    return t * t * (3.0 - 2.0 * t);
}

FitnessPtr requireInput(FitnessPtr f, const char* name) {
    if (!f) {
        throw std::invalid_argument(std::string(name) + ": input fitness is null");
    }
    return f;
}

class ConstantFitness : public Fitness {
public:
    explicit ConstantFitness(double value) : m_value(value) {}
    double evaluate(const DecorationContext&) const override { return m_value; }

private:
    double m_value;
};

class NoiseFitness : public Fitness {
public:
    NoiseFitness(double scaleX, double scaleZ, double offsetX, double offsetZ)
        : m_scaleX(scaleX), m_scaleZ(scaleZ), m_offsetX(offsetX), m_offsetZ(offsetZ) {
        if (scaleX == 0.0 || scaleZ == 0.0) {
            throw std::invalid_argument("noise2D scale must be non-zero");
        }
    }

    double evaluate(const DecorationContext& ctx) const override {
        const double n = ctx.noise2D(ctx.x / m_scaleX + m_offsetX,
                                     ctx.z / m_scaleZ + m_offsetZ);
        return (n + 1.0) / 2.0;
    }

private:
    double m_scaleX;
    double m_scaleZ;
    double m_offsetX;
    double m_offsetZ;
};

// Reads one raw field of the context
class FieldFitness : public Fitness {
public:
    using Reader = double (*)(const DecorationContext&);
    explicit FieldFitness(Reader reader) : m_reader(reader) {}
    double evaluate(const DecorationContext& ctx) const override { return m_reader(ctx); }

private:
    Reader m_reader;
};

class InRangeFitness : public Fitness {
public:
    InRangeFitness(FitnessPtr input, double min, double max)
        : m_input(std::move(input)), m_min(min), m_max(max) {}

    double evaluate(const DecorationContext& ctx) const override {
        const double v = m_input->evaluate(ctx);
        return (v >= m_min && v <= m_max) ? 1.0 : 0.0;
    }

private:
    FitnessPtr m_input;
    double m_min;
    double m_max;
};

class StepFitness : public Fitness {
public:
    StepFitness(FitnessPtr input, double threshold)
        : m_input(std::move(input)), m_threshold(threshold) {}

    double evaluate(const DecorationContext& ctx) const override {
        return m_input->evaluate(ctx) < m_threshold ? 0.0 : 1.0;
    }

private:
    FitnessPtr m_input;
    double m_threshold;
};

class LinearEaseInFitness : public Fitness {
public:
    LinearEaseInFitness(FitnessPtr input, double min0, double min1)
        : m_input(std::move(input)), m_min0(min0), m_min1(min1) {}

    double evaluate(const DecorationContext& ctx) const override {
        const double v = m_input->evaluate(ctx);
        if (v <= m_min0) return 0.0;
        if (v >= m_min1) return 1.0;
        return (v - m_min0) / (m_min1 - m_min0);
    }

private:
    FitnessPtr m_input;
    double m_min0;
    double m_min1;
};

class LinearEaseOutFitness : public Fitness {
public:
    LinearEaseOutFitness(FitnessPtr input, double max1, double max0)
        : m_input(std::move(input)), m_max1(max1), m_max0(max0) {}

    double evaluate(const DecorationContext& ctx) const override {
        const double v = m_input->evaluate(ctx);
        if (v <= m_max1) return 1.0;
        if (v >= m_max0) return 0.0;
        return (m_max0 - v) / (m_max0 - m_max1);
    }

private:
    FitnessPtr m_input;
    double m_max1;
    double m_max0;
};

class SmoothRangeFitness : public Fitness {
public:
    SmoothRangeFitness(FitnessPtr input, double min0, double min1, double max1, double max0)
        : m_input(std::move(input)), m_min0(min0), m_min1(min1), m_max1(max1), m_max0(max0) {}

    double evaluate(const DecorationContext& ctx) const override {
        const double v = m_input->evaluate(ctx);
        const double rise = smoothstep(m_min0, m_min1, v);
        if (std::isinf(m_max1)) {
            return rise;
        }
        return rise * (1.0 - smoothstep(m_max1, m_max0, v));
    }

private:
    FitnessPtr m_input;
    double m_min0;
    double m_min1;
    double m_max1;
    double m_max0;
};

class MaxFitness : public Fitness {
public:
    MaxFitness(FitnessPtr a, FitnessPtr b) : m_a(std::move(a)), m_b(std::move(b)) {}

    double evaluate(const DecorationContext& ctx) const override {
        return std::max(m_a->evaluate(ctx), m_b->evaluate(ctx));
    }

private:
    FitnessPtr m_a;
    FitnessPtr m_b;
};

class AllFitness : public Fitness {
public:
    explicit AllFitness(std::vector<FitnessPtr> parts) : m_parts(std::move(parts)) {}

    double evaluate(const DecorationContext& ctx) const override {
        double product = 1.0;
        for (const auto& part : m_parts) {
            product *= part->evaluate(ctx);
            if (product == 0.0) break;
        }
        return product;
    }

private:
    std::vector<FitnessPtr> m_parts;
};

class AnyFitness : public Fitness {
public:
    explicit AnyFitness(std::vector<FitnessPtr> parts) : m_parts(std::move(parts)) {}

    double evaluate(const DecorationContext& ctx) const override {
        double best = 0.0;
        for (const auto& part : m_parts) {
            best = std::max(best, part->evaluate(ctx));
        }
        return best;
    }

private:
    std::vector<FitnessPtr> m_parts;
};

// Floors the wrapped score
class MinimumFitness : public Fitness {
public:
    MinimumFitness(FitnessPtr input, double minimum)
        : m_input(std::move(input)), m_minimum(minimum) {}

    double evaluate(const DecorationContext& ctx) const override {
        return std::max(m_minimum, m_input->evaluate(ctx));
    }

private:
    FitnessPtr m_input;
    double m_minimum;
};

} // namespace

namespace Signal {

FitnessPtr constant(double value) {
    return std::make_shared<ConstantFitness>(value);
}

FitnessPtr noise2D(double scaleX, double scaleZ, double offsetX, double offsetZ) {
    return std::make_shared<NoiseFitness>(scaleX, scaleZ, offsetX, offsetZ);
}

FitnessPtr distanceToRiver() {
    return std::make_shared<FieldFitness>(
        [](const DecorationContext& ctx) { return ctx.distanceToRiver; });
}

FitnessPtr elevation() {
    return std::make_shared<FieldFitness>(
        [](const DecorationContext& ctx) { return ctx.elevation; });
}

FitnessPtr slope() {
    return std::make_shared<FieldFitness>(
        [](const DecorationContext& ctx) { return ctx.slope * RAD_TO_DEG; });
}

FitnessPtr biomeProgress() {
    return std::make_shared<FieldFitness>(
        [](const DecorationContext& ctx) { return ctx.biomeProgress; });
}

FitnessPtr inRange(FitnessPtr f, double min, double max) {
    return std::make_shared<InRangeFitness>(requireInput(std::move(f), "inRange"), min, max);
}

FitnessPtr step(FitnessPtr f, double threshold) {
    return std::make_shared<StepFitness>(requireInput(std::move(f), "step"), threshold);
}

FitnessPtr linearEaseIn(FitnessPtr f, double min0, double min1) {
    if (min1 <= min0) {
        throw std::invalid_argument("linearEaseIn requires min0 < min1");
    }
    return std::make_shared<LinearEaseInFitness>(requireInput(std::move(f), "linearEaseIn"),
                                                 min0, min1);
}

FitnessPtr linearEaseOut(FitnessPtr f, double max1, double max0) {
    if (max0 <= max1) {
        throw std::invalid_argument("linearEaseOut requires max1 < max0");
    }
    return std::make_shared<LinearEaseOutFitness>(requireInput(std::move(f), "linearEaseOut"),
                                                  max1, max0);
}

FitnessPtr smoothRange(FitnessPtr f, double min0, double min1, double max1, double max0) {
    return std::make_shared<SmoothRangeFitness>(requireInput(std::move(f), "smoothRange"),
                                                min0, min1, max1, max0);
}

FitnessPtr max(FitnessPtr a, FitnessPtr b) {
    return std::make_shared<MaxFitness>(requireInput(std::move(a), "max"),
                                        requireInput(std::move(b), "max"));
}

} // namespace Signal

namespace Combine {

FitnessPtr all(std::vector<FitnessPtr> parts) {
    for (const auto& part : parts) {
        requireInput(part, "Combine::all");
    }
    return std::make_shared<AllFitness>(std::move(parts));
}

FitnessPtr any(std::vector<FitnessPtr> parts) {
    for (const auto& part : parts) {
        requireInput(part, "Combine::any");
    }
    return std::make_shared<AnyFitness>(std::move(parts));
}

} // namespace Combine

FitnessPtr makeFitness(const FitnessParams& params) {
    std::vector<FitnessPtr> parts;
    parts.push_back(Signal::constant(params.fitness));

    if (params.linearEaseIn) {
        parts.push_back(Signal::linearEaseIn(Signal::distanceToRiver(),
                                             params.linearEaseIn->first,
                                             params.linearEaseIn->second));
    }
    if (params.linearEaseOut) {
        parts.push_back(Signal::linearEaseOut(Signal::distanceToRiver(),
                                              params.linearEaseOut->first,
                                              params.linearEaseOut->second));
    }
    if (params.stepDistance) {
        parts.push_back(Signal::inRange(Signal::distanceToRiver(),
                                        params.stepDistance->first,
                                        params.stepDistance->second));
    }
    if (params.stepNoise) {
        const StepNoiseParams& sn = *params.stepNoise;
        parts.push_back(Signal::step(
            Signal::noise2D(sn.scaleX, sn.scaleZ, sn.offsetX, sn.offsetZ), sn.threshold));
    }
    if (params.elevation) {
        parts.push_back(Signal::inRange(Signal::elevation(), params.elevation->first,
                                        params.elevation->second));
    }
    if (params.slope) {
        parts.push_back(Signal::inRange(Signal::slope(), params.slope->first,
                                        params.slope->second));
    }

    FitnessPtr combined = Combine::all(std::move(parts));
    if (params.minFitness) {
        combined = std::make_shared<MinimumFitness>(std::move(combined), *params.minFitness);
    }
    return combined;
}

} // namespace RiverForge
