#include "uuidgen-app.hpp"
#include <uuid/uuid-string.hpp>
#include <generators/generators.hpp>
#include <sources/clock.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace uuidgen{
namespace app{
    static const char* variant_name(UUID::Variant variant){
        switch(variant){
            case UUID::Variant::ncs:
                return "ncs";
            case UUID::Variant::rfc4122:
                return "rfc4122";
            case UUID::Variant::microsoft:
                return "microsoft";
            case UUID::Variant::future:
                return "future";
        }
        return "unknown";
    }

    boost::json::object describe(const UUID::Uuid& uuid){
        boost::json::object jo;
        jo.emplace("uuid", boost::json::string(UUID::to_string(uuid)));
        jo.emplace("urn", boost::json::string(UUID::to_urn(uuid)));
        jo.emplace("nil", uuid.is_nil());
        jo.emplace("version", static_cast<unsigned>(uuid.version()));
        jo.emplace("variant", boost::json::string(variant_name(uuid.variant())));
        if(uuid.version() == UUID::Version::time && uuid.variant() == UUID::Variant::rfc4122){
            std::stringstream node;
            node << uuid.node();
            jo.emplace("timestamp", uuid.timestamp());
            jo.emplace("unix_time_100ns", UUID::to_unix_time(uuid.timestamp()));
            jo.emplace("clock_seq", uuid.clock_seq());
            jo.emplace("node", boost::json::string(node.str()));
            jo.emplace("random_node", uuid.node().is_multicast());
        }
        return jo;
    }

    UuidGen::UuidGen(const Options& options)
      : options_(options),
        rng_{}
    {}

    int UuidGen::run(std::ostream& out){
        if(!options_.decode.empty()){
            return decode(out);
        }
        return generate(out);
    }

    int UuidGen::decode(std::ostream& out){
        std::error_code ec;
        UUID::Uuid uuid;
        if(options_.decode.size() == UUID::string_length){
            uuid = UUID::from_string(options_.decode, ec);
        } else {
            uuid = UUID::from_urn(options_.decode, ec);
        }
        if(ec){
            std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":cannot decode '" << options_.decode << "':" << ec.message() << std::endl;
            return EXIT_FAILURE;
        }
        out << boost::json::serialize(describe(uuid)) << std::endl;
        return EXIT_SUCCESS;
    }

    bool UuidGen::resolve_namespace(UUID::Uuid& name_space){
        const std::string& ns = options_.name_space;
        if(ns == "dns"){
            name_space = UUID::ns::dns;
        } else if(ns == "url"){
            name_space = UUID::ns::url;
        } else if(ns == "oid"){
            name_space = UUID::ns::oid;
        } else if(ns == "x500"){
            name_space = UUID::ns::x500;
        } else {
            std::error_code ec;
            name_space = UUID::from_string(ns, ec);
            if(ec){
                std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":bad namespace '" << ns << "':" << ec.message() << std::endl;
                return false;
            }
        }
        return true;
    }

    std::unique_ptr<UUID::NodeSource> UuidGen::make_node_source(){
        if(options_.random_node){
            return std::make_unique<UUID::RandomNodeSource>(rng_);
        }
        if(!options_.node.empty()){
            UUID::Node node = {};
            std::stringstream ss(options_.node);
            ss >> node;
            if(ss.fail() || ss.peek() != std::char_traits<char>::eof()){
                std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":bad node id '" << options_.node << "'." << std::endl;
                return nullptr;
            }
            return std::make_unique<UUID::StaticNodeSource>(node);
        }
        if(!options_.interface.empty()){
            return std::make_unique<UUID::InterfaceNodeSource>(options_.interface);
        }
        return std::make_unique<UUID::InterfaceNodeSource>();
    }

    void UuidGen::write(std::ostream& out, const UUID::Uuid& uuid){
        switch(options_.output){
            case Output::json:
                out << boost::json::serialize(describe(uuid)) << std::endl;
                break;
            case Output::urn:
                out << UUID::to_urn(uuid) << std::endl;
                break;
            case Output::text:
                out << UUID::to_string(uuid, options_.upper ? UUID::Case::upper : UUID::Case::lower) << std::endl;
                break;
        }
        return;
    }

    int UuidGen::generate(std::ostream& out){
        std::error_code ec;
        switch(options_.version){
            case 1:
            {
                std::unique_ptr<UUID::NodeSource> nodes = make_node_source();
                if(!nodes){
                    return EXIT_FAILURE;
                }
                UUID::SystemClock clock;
                UUID::TimeGenerator generator(clock, *nodes, rng_);
                for(std::size_t i=0; i < options_.count; ++i){
                    UUID::Uuid uuid = generator.generate(ec);
                    if(ec){
                        std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":version 1 generation failed:" << ec.message() << std::endl;
                        if(ec == UUID::errc::node_id_unavailable){
                            std::cerr << "pass -m <node id> or -r to use a random multicast node id." << std::endl;
                        }
                        return EXIT_FAILURE;
                    }
                    write(out, uuid);
                }
                break;
            }
            case 3:
            case 5:
            {
                if(!options_.has_name){
                    std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":version " << options_.version << " needs a name (-N)." << std::endl;
                    return EXIT_FAILURE;
                }
                UUID::Uuid name_space;
                if(!resolve_namespace(name_space)){
                    return EXIT_FAILURE;
                }
                // Name based uuids are deterministic, every copy is the same.
                UUID::Uuid uuid = (options_.version == 3)
                    ? UUID::make_v3(name_space, options_.name, ec)
                    : UUID::make_v5(name_space, options_.name, ec);
                if(ec){
                    std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":version " << options_.version << " generation failed:" << ec.message() << std::endl;
                    return EXIT_FAILURE;
                }
                for(std::size_t i=0; i < options_.count; ++i){
                    write(out, uuid);
                }
                break;
            }
            case 4:
            {
                for(std::size_t i=0; i < options_.count; ++i){
                    UUID::Uuid uuid = UUID::make_v4(rng_, ec);
                    if(ec){
                        std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":version 4 generation failed:" << ec.message() << std::endl;
                        return EXIT_FAILURE;
                    }
                    write(out, uuid);
                }
                break;
            }
            default:
                std::cerr << "uuidgen-app.cpp:" << __LINE__ << ":unsupported version " << options_.version << "." << std::endl;
                return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
}// app
}// uuidgen
