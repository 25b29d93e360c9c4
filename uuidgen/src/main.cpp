#include "app/uuidgen-app.hpp"
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <charconv>
#include <string_view>

static void usage(){
    std::cerr << "Usage: uuidgen [-v 1|3|4|5] [-n dns|url|oid|x500|<uuid>] [-N name] [-c count]" << std::endl;
    std::cerr << "               [-m node_id] [-i interface] [-r] [-u] [-U] [-j]" << std::endl;
    std::cerr << "       uuidgen -d <uuid>" << std::endl;
    return;
}

template<class T>
static bool parse_number(const char* str, T& value){
    std::string_view sv(str);
    std::from_chars_result fcres = std::from_chars(sv.data(), sv.data()+sv.size(), value, 10);
    if(fcres.ec != std::errc() || fcres.ptr != sv.data()+sv.size()){
        std::cerr << "main.cpp:" << __LINE__ << ":'" << str << "' is not a number:" << std::make_error_code(fcres.ec == std::errc() ? std::errc::invalid_argument : fcres.ec).message() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[])
{
    uuidgen::app::Options options;
    // The environment provides defaults for the node id, flags override them.
    const char* UUIDGEN_NODE = getenv("UUIDGEN_NODE");
    if(UUIDGEN_NODE != nullptr){
        options.node = UUIDGEN_NODE;
    }
    const char* UUIDGEN_INTERFACE = getenv("UUIDGEN_INTERFACE");
    if(UUIDGEN_INTERFACE != nullptr){
        options.interface = UUIDGEN_INTERFACE;
    }

    int opt;
    while((opt = getopt(argc, argv, "v:n:N:c:m:i:ruUjd:h")) != -1){
        switch(opt)
        {
            case 'v':
                if(!parse_number(optarg, options.version)){
                    usage();
                    exit(EXIT_FAILURE);
                }
                break;
            case 'n':
                options.name_space = optarg;
                break;
            case 'N':
                options.name = optarg;
                options.has_name = true;
                break;
            case 'c':
                if(!parse_number(optarg, options.count) || options.count == 0){
                    usage();
                    exit(EXIT_FAILURE);
                }
                break;
            case 'm':
                options.node = optarg;
                options.random_node = false;
                break;
            case 'i':
                options.interface = optarg;
                options.node.clear();
                break;
            case 'r':
                options.random_node = true;
                break;
            case 'u':
                options.output = uuidgen::app::Output::urn;
                break;
            case 'U':
                options.upper = true;
                break;
            case 'j':
                options.output = uuidgen::app::Output::json;
                break;
            case 'd':
                options.decode = optarg;
                break;
            case 'h':
                usage();
                exit(EXIT_SUCCESS);
            default:
                usage();
                exit(EXIT_FAILURE);
        }
    }
    if(optind < argc){
        usage();
        exit(EXIT_FAILURE);
    }
    uuidgen::app::UuidGen app(options);
    return app.run(std::cout);
}
