#ifndef UUIDGEN_APP_HPP
#define UUIDGEN_APP_HPP
#include <uuid/uuid.hpp>
#include <sources/node-source.hpp>
#include <sources/random-source.hpp>
#include <boost/json.hpp>
#include <iosfwd>
#include <memory>
#include <string>

namespace uuidgen{
namespace app{
    enum class Output
    {
        text,
        urn,
        json
    };

    // Command line and environment settings, see main.cpp for the flags.
    struct Options
    {
        int version = 4;
        std::string name_space = "dns";
        std::string name;
        bool has_name = false;
        std::size_t count = 1;
        std::string node;
        std::string interface;
        bool random_node = false;
        bool upper = false;
        Output output = Output::text;
        std::string decode;
    };

    // Decoded fields of a uuid, as written by -j and -d.
    boost::json::object describe(const UUID::Uuid& uuid);

    class UuidGen
    {
    public:
        explicit UuidGen(const Options& options);
        // Writes the requested uuids to out. Diagnostics go to std::cerr.
        // Returns the process exit status.
        int run(std::ostream& out);

    private:
        int generate(std::ostream& out);
        int decode(std::ostream& out);
        bool resolve_namespace(UUID::Uuid& name_space);
        std::unique_ptr<UUID::NodeSource> make_node_source();
        void write(std::ostream& out, const UUID::Uuid& uuid);

        Options options_;
        UUID::SystemRandomSource rng_;
    };
}// app
}// uuidgen
#endif
