#include "test_util.hpp"
#include "util/logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace asmhom;

static std::string g_test_dir;

// Redirect stderr into a file for the lifetime of the object.
class StderrCapture {
public:
    explicit StderrCapture(const std::string& path) : path_(path) {
        std::fflush(stderr);
        saved_fd_ = ::dup(STDERR_FILENO);
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd >= 0) {
            ::dup2(fd, STDERR_FILENO);
            ::close(fd);
        }
    }

    ~StderrCapture() { restore(); }

    std::string finish() {
        restore();
        std::ifstream in(path_, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

private:
    void restore() {
        if (saved_fd_ < 0) return;
        std::fflush(stderr);
        ::dup2(saved_fd_, STDERR_FILENO);
        ::close(saved_fd_);
        saved_fd_ = -1;
    }

    std::string path_;
    int saved_fd_ = -1;
};

static void test_levels_and_tags() {
    std::fprintf(stderr, "-- test_levels_and_tags\n");

    StderrCapture cap(g_test_dir + "/levels.log");
    Logger logger(Logger::kWarn);
    logger.error("disk %s", "full");
    logger.warn("count=%d", 3);
    logger.info("hidden");
    logger.debug("hidden too");
    std::string out = cap.finish();

    CHECK_CONTAINS(out, "[ERROR] disk full\n");
    CHECK_CONTAINS(out, "[WARN] count=3\n");
    CHECK(out.find("hidden") == std::string::npos);
    CHECK(!logger.verbose());
}

static void test_long_message_not_truncated() {
    std::fprintf(stderr, "-- test_long_message_not_truncated\n");

    std::string tool_output;
    for (int i = 0; i < 3000; i++) {
        tool_output += "stderr line " + std::to_string(i) + "\n";
    }
    tool_output += "final diagnostic";

    StderrCapture cap(g_test_dir + "/long.log");
    Logger logger(Logger::kError);
    logger.error("tool output:\n%s", tool_output.c_str());
    std::string out = cap.finish();

    CHECK(out.size() > tool_output.size());
    CHECK_CONTAINS(out, "[ERROR] tool output:\nstderr line 0\n");
    CHECK_CONTAINS(out, "stderr line 2999\nfinal diagnostic\n");
}

int main() {
    g_test_dir = "/tmp/asmhom_logger_test";
    std::filesystem::remove_all(g_test_dir);
    std::filesystem::create_directories(g_test_dir);

    test_levels_and_tags();
    test_long_message_not_truncated();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
