/**
 * @file sensor_sim.cpp
 * @brief Implementation of the simulated sensor
 *
 * @details
 * Base patterns are sine segments with a random amplitude in [0.5, 1.0] and
 * a random phase per dimension. Fresh windows are uniform in [-1, 1].
 */

#include "peripheral/sensor_sim.h"
#include "peripheral/logger.h"

#include <cmath>

SensorSim::SensorSim(const std::string& deviceId, const SensorSimConfig& config)
    : device(deviceId), settings(config), rng(config.seed), nextTimestamp(config.startTimestamp) {
    const double twoPi = 6.283185307179586;
    const size_t valuesPerWindow = settings.windowLength * settings.arity;

    patterns.resize(settings.patternCount);
    for (std::vector<double>& pattern : patterns) {
        pattern.resize(valuesPerWindow);
        for (size_t d = 0; d < settings.arity; d++) {
            double amplitude = uniform(0.5, 1.0);
            double phase = uniform(0.0, twoPi);
            for (size_t i = 0; i < settings.windowLength; i++) {
                double angle = twoPi * (double)i / (double)settings.windowLength + phase;
                pattern[i * settings.arity + d] = amplitude * std::sin(angle);
            }
        }
    }
    LOG_DEBUG(LOG_TAG_SIM, "[%s] %zu patterns, %.0f%% near-duplicates, seed %llu",
              device.c_str(), patterns.size(), settings.duplicateFraction * 100.0,
              (unsigned long long)settings.seed);
}

std::vector<Sample> SensorSim::nextWindow() {
    const size_t valuesPerWindow = settings.windowLength * settings.arity;
    std::vector<double> values(valuesPerWindow);

    bool duplicate = !patterns.empty() && uniform(0.0, 1.0) < settings.duplicateFraction;
    if (duplicate) {
        size_t which = (size_t)(uniform(0.0, 1.0) * (double)patterns.size());
        if (which >= patterns.size()) {
            which = patterns.size() - 1;
        }
        double amplitude = uniform(0.0, settings.noiseAmplitude);
        for (size_t k = 0; k < valuesPerWindow; k++) {
            values[k] = patterns[which][k] + uniform(-amplitude, amplitude);
        }
        duplicates++;
    } else {
        for (size_t k = 0; k < valuesPerWindow; k++) {
            values[k] = uniform(-1.0, 1.0);
        }
    }

    std::vector<Sample> samples(settings.windowLength);
    for (size_t i = 0; i < settings.windowLength; i++) {
        Sample& sample = samples[i];
        sample.deviceId = device;
        sample.timestamp = nextTimestamp;
        nextTimestamp += settings.periodMs;
        sample.values.resize(settings.arity);
        for (size_t d = 0; d < settings.arity; d++) {
            sample.values[d] = settings.baseline + values[i * settings.arity + d];
        }
    }
    windows++;
    return samples;
}

std::vector<Sample> SensorSim::generate(size_t windowCount) {
    std::vector<Sample> samples;
    samples.reserve(windowCount * settings.windowLength);
    for (size_t w = 0; w < windowCount; w++) {
        std::vector<Sample> window = nextWindow();
        samples.insert(samples.end(), window.begin(), window.end());
    }
    return samples;
}

double SensorSim::uniform(double a, double b) {
    if (b <= a) {
        return a;
    }
    std::uniform_real_distribution<double> dist(a, b);
    return dist(rng);
}
