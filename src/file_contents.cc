#include <cerrno>
#include <chklib/defer.hh>
#include <chklib/file_contents.hh>
#include <chklib/macros/throw.hh>
#include <cstdio>
#include <cstring>

std::string get_file_contents(const std::string& path) {
    FILE* f = fopen(path.c_str(), "rbe");
    if (f == nullptr) {
        THROW("fopen('", path, "') - ", strerror(errno));
    }
    Defer closer = [f] { (void)fclose(f); };

    std::string res;
    char buff[1 << 16];
    size_t len = 0;
    while ((len = fread(buff, 1, sizeof(buff), f)) > 0) {
        res.append(buff, len);
    }
    if (ferror(f)) {
        THROW("fread('", path, "') failed");
    }
    return res;
}
