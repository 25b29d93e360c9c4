#include "random-source.hpp"
#include <cerrno>
#include <sys/random.h>

namespace UUID{
    void SystemRandomSource::fill(unsigned char* buf, std::size_t len, std::error_code& ec){
        std::size_t filled = 0;
        while(filled < len){
            ssize_t length = getrandom(buf + filled, len - filled, 0);
            if(length == -1){
                // A signal interrupted the call before any bytes were copied.
                if(errno == EINTR){
                    continue;
                }
                ec = errc::entropy_unavailable;
                return;
            }
            filled += static_cast<std::size_t>(length);
        }
        ec.clear();
        return;
    }
}// UUID namespace
