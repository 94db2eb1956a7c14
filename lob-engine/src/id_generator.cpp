#include "lob/id_generator.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <memory>
#include <mutex>

namespace lob {

IdGenerator make_uuid_generator() {
    // random_generator is not thread-safe; share one instance behind a mutex
    struct State {
        std::mutex mtx;
        boost::uuids::random_generator gen;
    };
    auto st = std::make_shared<State>();

    return [st]() {
        boost::uuids::uuid u;
        {
            std::lock_guard<std::mutex> lk(st->mtx);
            u = st->gen();
        }
        return boost::uuids::to_string(u);
    };
}

int64_t now_wall_us() {
    using namespace std::chrono;
    return (int64_t)duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace lob
