#pragma once

#include <atomic>
#include <string>

// Stop request observed between sleep ticks. Raised by a signal handler flag,
// by request(), or by an operator creating the sentinel file.
class ShutdownSignal {
public:
    explicit ShutdownSignal(std::string sentinel_path,
                            const std::atomic<bool>* signal_flag = nullptr);

    void request();
    bool requested() const;

    // Removes the sentinel so the next start is not stopped immediately
    void clear();

    const std::string& sentinel_path() const { return sentinel_path_; }

private:
    std::string sentinel_path_;
    const std::atomic<bool>* signal_flag_;
    std::atomic<bool> requested_{false};
};
