#include "generators-tests.hpp"
#include "../fakes/fake-sources.hpp"
#include "../../src/uuid/uuid-string.hpp"
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace tests
{
    static bool is_rfc4122(const UUID::Uuid& uuid, UUID::Version version){
        return uuid.version() == version
            && (uuid.bytes()[8] & 0xc0) == 0x80
            && uuid.variant() == UUID::Variant::rfc4122;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V4)
      : passed_{false},
        ec_{}
    {
        UUID::SystemRandomSource rng;
        UUID::Uuid first = UUID::make_v4(rng, ec_);
        if(ec_){
            return;
        }
        UUID::Uuid second = UUID::make_v4(rng, ec_);
        if(ec_){
            return;
        }
        if(first == second){
            return;
        }
        if(!is_rfc4122(first, UUID::Version::random) || !is_rfc4122(second, UUID::Version::random)){
            return;
        }

        // Version and variant are stamped over whatever the source produced.
        FixedRandomSource ones(0xff);
        if(UUID::to_string(UUID::make_v4(ones, ec_)) != "ffffffff-ffff-4fff-bfff-ffffffffffff" || ec_){
            return;
        }
        FixedRandomSource zeros(0x00);
        if(UUID::to_string(UUID::make_v4(zeros, ec_)) != "00000000-0000-4000-8000-000000000000" || ec_){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V4NoEntropy)
      : passed_{false},
        ec_{}
    {
        FailingRandomSource rng;
        UUID::Uuid uuid = UUID::make_v4(rng, ec_);
        if(ec_ != UUID::errc::entropy_unavailable || !uuid.is_nil()){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V3)
      : passed_{false},
        ec_{}
    {
        UUID::Uuid uuid = UUID::make_v3(UUID::ns::dns, "python.org", ec_);
        if(ec_ || UUID::to_string(uuid) != "6fa459ea-ee8a-3ca4-894e-db77e160355e"){
            return;
        }
        if(!is_rfc4122(uuid, UUID::Version::md5)){
            return;
        }
        uuid = UUID::make_v3(UUID::ns::url, "https://example.com", ec_);
        if(ec_ || UUID::to_string(uuid) != "68794df6-5e20-385f-ab08-bb73f8a433cb"){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V5)
      : passed_{false},
        ec_{}
    {
        UUID::Uuid uuid = UUID::make_v5(UUID::ns::dns, "python.org", ec_);
        if(ec_ || UUID::to_string(uuid) != "886313e1-3b8a-5372-9b90-0c9aee199e5d"){
            return;
        }
        if(!is_rfc4122(uuid, UUID::Version::sha1)){
            return;
        }
        uuid = UUID::make_v5(UUID::ns::url, "https://example.com", ec_);
        if(ec_ || UUID::to_string(uuid) != "4fd35a71-71ef-5a55-a9d9-aa75c889a6d0"){
            return;
        }
        // An empty name hashes the namespace alone.
        uuid = UUID::make_v5(UUID::ns::dns, "", ec_);
        if(ec_ || UUID::to_string(uuid) != "4ebd0208-8328-5d69-8c44-ec50939c0967"){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::NameDeterminism)
      : passed_{false},
        ec_{}
    {
        const UUID::Uuid namespaces[] = {UUID::ns::dns, UUID::ns::url, UUID::ns::oid, UUID::ns::x500};
        const std::string names[] = {"test", "example", "sample"};
        std::set<std::string> seen;
        for(const UUID::Uuid& ns: namespaces){
            for(const std::string& name: names){
                UUID::Uuid v3 = UUID::make_v3(ns, name, ec_);
                if(ec_){
                    return;
                }
                UUID::Uuid v3_again = UUID::make_v3(ns, name, ec_);
                if(ec_ || v3 != v3_again){
                    return;
                }
                UUID::Uuid v5 = UUID::make_v5(ns, name, ec_);
                if(ec_){
                    return;
                }
                UUID::Uuid v5_again = UUID::make_v5(
                    ns,
                    (const unsigned char*)(name.data()),
                    name.size(),
                    ec_
                );
                if(ec_ || v5 != v5_again){
                    return;
                }
                if(v3 == v5){
                    return;
                }
                if(!is_rfc4122(v3, UUID::Version::md5) || !is_rfc4122(v5, UUID::Version::sha1)){
                    return;
                }
                seen.insert(UUID::to_string(v3));
                seen.insert(UUID::to_string(v5));
            }
        }
        // Any change to the namespace or the name gives a different uuid.
        if(seen.size() != 2*4*3){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1Layout)
      : passed_{false},
        ec_{}
    {
        const std::uint64_t ticks = 0x0123456789abcdefULL;
        const UUID::Node node = {{0x03, 0x2a, 0x35, 0x0d, 0x13, 0x80}};
        FixedClock clock(ticks);
        UUID::StaticNodeSource nodes(node);
        FixedRandomSource rng(0xff);
        UUID::TimeGenerator generator(clock, nodes, rng);

        UUID::Uuid uuid = generator.generate(ec_);
        if(ec_){
            return;
        }
        if(UUID::to_string(uuid) != "89abcdef-4567-1123-bfff-032a350d1380"){
            std::cerr << "generators-tests.cpp:v1 layout:" << uuid << std::endl;
            return;
        }
        if(!is_rfc4122(uuid, UUID::Version::time)){
            return;
        }
        if(uuid.timestamp() != ticks || uuid.node() != node || uuid.clock_seq() != 0x3fff){
            return;
        }
        // The clock sequence is seeded once.
        generator.generate(ec_);
        if(ec_ || rng.calls() != 1){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1SameTick)
      : passed_{false},
        ec_{}
    {
        const std::uint64_t ticks = 0x01e0000000000000ULL;
        FixedClock clock(ticks);
        UUID::StaticNodeSource nodes(UUID::Node{{0x02, 0x00, 0x00, 0x00, 0x00, 0x01}});
        FixedRandomSource rng(0x12);
        UUID::TimeGenerator generator(clock, nodes, rng);

        std::vector<UUID::Uuid> uuids;
        for(int i=0; i < 3; ++i){
            uuids.push_back(generator.generate(ec_));
            if(ec_){
                return;
            }
        }
        for(std::size_t i=0; i < uuids.size(); ++i){
            if(uuids[i].timestamp() != ticks + i){
                return;
            }
            if(uuids[i].clock_seq() != uuids[0].clock_seq()){
                return;
            }
        }
        // A clock that advances slower than the handed out ticks does not reuse them.
        clock.set(ticks + 1);
        UUID::Uuid next = generator.generate(ec_);
        if(ec_ || next.timestamp() != ticks + 3){
            return;
        }
        clock.set(ticks + 100);
        next = generator.generate(ec_);
        if(ec_ || next.timestamp() != ticks + 100){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1ClockRegression)
      : passed_{false},
        ec_{}
    {
        const std::uint64_t ticks = 0x01e0000000000000ULL;
        FixedClock clock(ticks);
        UUID::StaticNodeSource nodes(UUID::Node{{0x02, 0x00, 0x00, 0x00, 0x00, 0x01}});
        FixedRandomSource rng(0xff);
        UUID::TimeGenerator generator(clock, nodes, rng);

        UUID::Uuid before = generator.generate(ec_);
        if(ec_ || before.clock_seq() != 0x3fff){
            return;
        }
        clock.set(ticks - 100);
        UUID::Uuid after = generator.generate(ec_);
        if(ec_){
            return;
        }
        // 0x3fff + 1 wraps within 14 bits.
        if(after.clock_seq() != 0 || after.timestamp() != ticks - 100){
            return;
        }
        if(after.clock_seq_hi_and_reserved() != 0x80 || after == before){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1NoNode)
      : passed_{false},
        ec_{}
    {
        FixedClock clock(0x01e0000000000000ULL);
        FailingNodeSource no_nodes;
        FixedRandomSource rng(0xff);
        UUID::TimeGenerator generator(clock, no_nodes, rng);
        UUID::Uuid uuid = generator.generate(ec_);
        if(ec_ != UUID::errc::node_id_unavailable || !uuid.is_nil()){
            return;
        }
        if(rng.calls() != 0){
            return;
        }

        UUID::StaticNodeSource nodes(UUID::Node{{0x02, 0x00, 0x00, 0x00, 0x00, 0x01}});
        FailingRandomSource no_entropy;
        UUID::TimeGenerator unseeded(clock, nodes, no_entropy);
        uuid = unseeded.generate(ec_);
        if(ec_ != UUID::errc::entropy_unavailable || !uuid.is_nil()){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1RandomNode)
      : passed_{false},
        ec_{}
    {
        FixedClock clock(0x01e0000000000000ULL);
        FixedRandomSource rng(0x00);
        UUID::RandomNodeSource nodes(rng);
        UUID::TimeGenerator generator(clock, nodes, rng);
        UUID::Uuid first = generator.generate(ec_);
        if(ec_){
            return;
        }
        UUID::Uuid second = generator.generate(ec_);
        if(ec_){
            return;
        }
        const UUID::Node expected = {{0x01, 0x00, 0x00, 0x00, 0x00, 0x00}};
        if(first.node() != expected || second.node() != expected){
            return;
        }
        if(!first.node().is_multicast()){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1Threads)
      : passed_{false},
        ec_{}
    {
        UUID::SystemClock clock;
        UUID::StaticNodeSource nodes(UUID::Node{{0x02, 0x00, 0x00, 0x00, 0x00, 0x01}});
        UUID::SystemRandomSource rng;
        UUID::TimeGenerator generator(clock, nodes, rng);

        const std::size_t num_threads = 4;
        const std::size_t per_thread = 2000;
        std::vector<std::vector<UUID::Uuid> > results(num_threads);
        std::vector<std::error_code> errors(num_threads);
        std::vector<std::thread> threads;
        for(std::size_t t=0; t < num_threads; ++t){
            threads.emplace_back([&, t](){
                for(std::size_t i=0; i < per_thread; ++i){
                    results[t].push_back(generator.generate(errors[t]));
                    if(errors[t]){
                        return;
                    }
                }
            });
        }
        for(std::thread& thread: threads){
            thread.join();
        }
        std::set<std::string> unique;
        for(std::size_t t=0; t < num_threads; ++t){
            if(errors[t]){
                return;
            }
            for(const UUID::Uuid& uuid: results[t]){
                if(!is_rfc4122(uuid, UUID::Version::time)){
                    return;
                }
                unique.insert(UUID::to_string(uuid));
            }
        }
        if(unique.size() != num_threads*per_thread){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(GeneratorsTests::V1NodeCallback)
      : passed_{false},
        ec_{}
    {
        // A node source may itself generate uuids from the same generator.
        FixedClock clock(0x01e0000000000000ULL);
        FixedRandomSource rng(0x00);
        CallbackNodeSource nodes(UUID::Node{{0x02, 0x00, 0x00, 0x00, 0x00, 0x01}});
        UUID::TimeGenerator generator(clock, nodes, rng);
        nodes.attach(&generator);
        UUID::Uuid outer = generator.generate(ec_);
        if(ec_){
            return;
        }
        const UUID::Uuid& inner = nodes.inner();
        if(!is_rfc4122(inner, UUID::Version::time) || !is_rfc4122(outer, UUID::Version::time)){
            return;
        }
        if(inner.timestamp() != 0x01e0000000000000ULL || outer.timestamp() != 0x01e0000000000001ULL){
            return;
        }
        if(inner.clock_seq() != outer.clock_seq()){
            return;
        }
        passed_ = true;
    }
}
