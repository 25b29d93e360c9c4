#include "uuid-errors.hpp"
#include <string>

namespace UUID{
    namespace {
        class UuidErrorCategory : public std::error_category
        {
        public:
            const char* name() const noexcept override { return "uuid"; }
            std::string message(int ev) const override {
                switch(static_cast<errc>(ev)){
                    case errc::invalid_length:
                        return "uuid byte sequence must be exactly 16 bytes";
                    case errc::invalid_format:
                        return "uuid string is not in canonical 8-4-4-4-12 hex form";
                    case errc::entropy_unavailable:
                        return "random source could not supply entropy";
                    case errc::node_id_unavailable:
                        return "node identifier is unavailable";
                    case errc::digest_unavailable:
                        return "name digest could not be computed";
                }
                return "unknown uuid error";
            }
        };
    }

    const std::error_category& error_category() noexcept {
        static const UuidErrorCategory category;
        return category;
    }

    std::error_code make_error_code(errc e) noexcept {
        return std::error_code(static_cast<int>(e), error_category());
    }
}// UUID namespace
