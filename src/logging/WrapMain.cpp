#include <spdlog/spdlog.h>

#include "SpdlogInit.hpp"

extern int app_main(int argc, char** argv);
int main(int argc, char** argv) {
    ResumableUpload_SpdlogInit();
    SPDLOG_DEBUG("Launching {} with {} args", argv[0], argc);
    const int ret = app_main(argc, argv);
    ResumableUpload_SpdlogDeInit();
    return ret;
}
