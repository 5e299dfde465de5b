#pragma once

#include <memory>

#include "FileSource.hpp"
#include "UploadCoordinator.hpp"
#include "UploadObserver.hpp"
#include "UploadTypes.hpp"
#include "net/UploadEndpoints.hpp"

namespace HealthUploader {

// Whole-file upload through a pre-signed PUT. Single request, no retry.
class PresignedUploader {
   public:
    PresignedUploader(Net::UploadEndpoints& endpoints,
                      UploadObserver& observer)
        : endpoints_(endpoints), observer_(observer) {}

    // Honors validation, onProgress, onError and stop from options. The
    // object key is returned in FinalAck::objectKey.
    UploadResult upload(std::shared_ptr<const FileSource> file,
                        const UploadOptions& options);

   private:
    Net::UploadEndpoints& endpoints_;
    UploadObserver& observer_;
};

}  // namespace HealthUploader
