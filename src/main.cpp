#include "functions/cli/src/cli.hpp"

#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#ifdef _WIN32
  #include <windows.h>
#endif

namespace fs = std::filesystem;

// exe가 있는 디렉토리
static fs::path exe_dir() {
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    return n ? fs::path(buf).parent_path() : fs::current_path();
#else
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::current_path() : self.parent_path();
#endif
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return run_cli(args, (exe_dir() / ".env").string(), std::cout, std::cerr);
}
