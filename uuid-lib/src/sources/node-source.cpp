#include "node-source.hpp"
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <sys/socket.h>

namespace UUID{
    Node InterfaceNodeSource::get_node_id(std::error_code& ec){
        struct ifaddrs* ifah;
        if(getifaddrs(&ifah) == -1){
            ec = errc::node_id_unavailable;
            return Node{};
        }
        Node node = {};
        bool found = false;
        for(struct ifaddrs* ifa = ifah; ifa != nullptr; ifa = ifa->ifa_next){
            if(ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET){
                continue;
            }
            if(!interface_.empty()){
                if(interface_ != ifa->ifa_name){
                    continue;
                }
            } else if(ifa->ifa_flags & IFF_LOOPBACK){
                continue;
            }
            // On Linux hardware addresses are reported in the AF_PACKET family.
            struct sockaddr_ll* sll = (struct sockaddr_ll*)(ifa->ifa_addr);
            if(sll->sll_halen != Node::length){
                continue;
            }
            Node candidate = {};
            std::memcpy(candidate.bytes, sll->sll_addr, Node::length);
            if(candidate == Node{} || candidate.is_multicast()){
                continue;
            }
            node = candidate;
            found = true;
            break;
        }
        freeifaddrs(ifah);
        if(!found){
            ec = errc::node_id_unavailable;
            return Node{};
        }
        ec.clear();
        return node;
    }

    Node RandomNodeSource::get_node_id(std::error_code& ec){
        if(!drawn_){
            Node tmp = {};
            rng_.fill(tmp.bytes, Node::length, ec);
            if(ec){
                return Node{};
            }
            tmp.bytes[0] |= 0x01;
            node_ = tmp;
            drawn_ = true;
        }
        ec.clear();
        return node_;
    }
}// UUID namespace
