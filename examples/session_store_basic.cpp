// session_store_basic.cpp
// Getting started with sessiondb: save, load, expire and sweep sessions

#include <iostream>
#include "sessiondb/sessiondb.hpp"

using namespace sessiondb;

int main(int argc, char** argv) {
    std::string url = argc > 1 ? argv[1] : "example_sessions.db";

    try {
        // Environment overrides the development preset when SDB_DATABASE_URL is set
        StoreConfig config = EnvConfig::from_environment().value_or(Presets::development(url));
        auto store = std::make_shared<SqlSessionDataStore>(config);
        store->initialize();

        std::cout << "sessiondb " << version() << " using " << store->adaptor().to_string() << std::endl;

        SessionContext ctx = store->make_context("/shop", "www.example.com");
        Timestamp now = Utils::now_milliseconds();

        // A new session lives for 30 minutes of inactivity
        SessionData session("a1b2c3d4", now, now, now, 1800);
        session.set_attribute("user", std::string("alice"));
        session.set_attribute("cart_items", int64_t(2));

        SaveResult result = store->store(session, ctx, now);
        std::cout << "saved " << session.id << ": " << Utils::save_result_to_string(result) << std::endl;

        if (auto loaded = store->load(session.id, ctx)) {
            std::cout << "loaded " << loaded->id << " last saved by " << loaded->last_node
                      << ", " << loaded->attributes.size() << " attributes" << std::endl;
        }

        // A session that is already past its expiry
        SessionData stale("e5f6a7b8", now - 10000, now - 10000, now - 10000, 1);
        store->store(stale, ctx, now - 10000);

        SessionSweeper sweeper(store, ctx, std::chrono::milliseconds(500));
        sweeper.set_expired_callback([](const SessionId& id) {
            std::cout << "expired " << id << std::endl;
        });
        size_t removed = sweeper.run_once(Utils::now_milliseconds());
        std::cout << "sweep removed " << removed << " session(s)" << std::endl;

        store->remove(session.id, ctx);
        std::cout << "exists after remove: " << std::boolalpha
                  << store->exists(session.id, ctx, Utils::now_milliseconds()) << std::endl;

    } catch (const Error& e) {
        std::cerr << "Error [" << e.category() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
