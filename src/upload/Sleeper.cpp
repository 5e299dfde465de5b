#include <condition_variable>
#include <mutex>
#include <upload/Sleeper.hpp>

namespace HealthUploader {

bool RealSleeper::sleepFor(std::chrono::milliseconds duration,
                           std::stop_token token) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    return !cv.wait_for(lock, token, duration,
                        [&token] { return token.stop_requested(); });
}

}  // namespace HealthUploader
