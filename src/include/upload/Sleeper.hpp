#pragma once

#include <chrono>
#include <stop_token>

namespace HealthUploader {

class Sleeper {
   public:
    virtual ~Sleeper() = default;
    // Returns false if the wait was interrupted by a stop request.
    virtual bool sleepFor(std::chrono::milliseconds duration,
                          std::stop_token token) = 0;
};

class RealSleeper : public Sleeper {
   public:
    bool sleepFor(std::chrono::milliseconds duration,
                  std::stop_token token) override;
};

}  // namespace HealthUploader
