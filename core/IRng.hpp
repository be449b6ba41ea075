#pragma once

#include <cstdint>
#include <random>

namespace devsim {

class IRng {
public:
    virtual ~IRng() = default;

    /// Uniform draw in [min, max)
    virtual double uniform(double min = 0.0, double max = 1.0) = 0;
};

class StandardRng : public IRng {
private:
    std::mt19937 gen_;

public:
    StandardRng() : gen_(std::random_device{}()) {}
    explicit StandardRng(std::uint32_t seed) : gen_(seed) {}

    double uniform(double min = 0.0, double max = 1.0) override {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(gen_);
    }
};

} // namespace devsim
