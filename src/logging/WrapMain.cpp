#include <LogCompat.hpp>

#include "SpdlogInit.hpp"

extern int app_main(int argc, char** argv);
int main(int argc, char** argv) {
    HealthUploader_SpdlogInit();
    DLOG(INFO) << "Launching " << argv[0] << " with " << argc << " args";
    const int ret = app_main(argc, argv);
    HealthUploader_SpdlogDeInit();
    return ret;
}
