#pragma once

#include <fcntl.h>
#include <cerrno>
#include <unistd.h>

#include "common/scoped.hpp"

namespace grader {

struct scoped_fd_traits {
    using value_type = int;

    static value_type invalid_value() { return -1; }

    static void free(value_type &fd) {
        while (close(fd) == -1 && errno == EINTR)
            ;
    }
};

using scoped_fd = scoped_generic<scoped_fd_traits>;

/**
 * @brief 创建管道，失败时 errno 被设置
 * @param flags 传给 pipe2 的标志，如 O_CLOEXEC
 */
inline bool make_pipe(scoped_fd &read_end, scoped_fd &write_end, int flags = 0) {
    int fds[2];
    if (pipe2(fds, flags) != 0) return false;
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

}  // namespace grader
