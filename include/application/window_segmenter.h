/**
 * @file window_segmenter.h
 * @brief Slices one device's ordered samples into fixed-length windows
 *
 * Samples are pushed one at a time; a window is handed out as soon as it
 * holds W samples, so the segmenter never buffers more than one partial
 * window. Timestamps must be strictly increasing across the whole session,
 * including across window boundaries.
 */

#ifndef WINDOW_SEGMENTER_H
#define WINDOW_SEGMENTER_H

#include <string>
#include <vector>

#include "application/engine_config.h"
#include "application/engine_fault.h"
#include "application/telemetry.h"

class WindowSegmenter {
public:
    /**
     * @param deviceId Device whose samples this segmenter accepts
     * @param windowLength W, must be at least 1
     * @param arity Values per sample, 0 = taken from the first sample
     * @param mode Trailing partial window policy used by finish()
     */
    WindowSegmenter(const std::string& deviceId, size_t windowLength,
                    size_t arity, TrailingWindowMode mode);

    /**
     * @brief Add one sample
     *
     * @param sample Next sample of the device
     * @param windowReady Output: true if `window` now holds a complete window
     * @param window Output: the completed window
     * @return MALFORMED_INPUT_ORDER, DEVICE_MISMATCH or ARITY_MISMATCH on bad input;
     *         the rejected sample is not buffered
     */
    EngineFault push(const Sample& sample, bool& windowReady, Window& window);

    /**
     * @brief End of input
     *
     * FLUSH mode hands out the partial window (if any) as a short window.
     * BUFFER mode keeps the pending samples; takePending() returns them.
     *
     * @return true if `window` holds a short final window
     */
    bool finish(Window& window);

    /**
     * @brief Remove and return the samples of the pending partial window
     */
    std::vector<Sample> takePending();

    size_t pendingCount() const { return pending.size(); }
    size_t windowsEmitted() const { return nextWindowIndex; }
    size_t arity() const { return sessionArity; }
    const std::string& deviceId() const { return device; }

private:
    Window buildWindow();

    std::string device;
    size_t windowLength;
    size_t sessionArity;
    TrailingWindowMode mode;
    std::vector<Sample> pending;
    bool haveLastTimestamp = false;
    int64_t lastTimestamp = 0;
    uint64_t nextWindowIndex = 0;
};

#endif // WINDOW_SEGMENTER_H
