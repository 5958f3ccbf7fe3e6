#include "chat/ClientRegistry.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace termchat::chat;

namespace {

class NullParticipant : public Participant {
public:
    bool deliver(const std::string&) override { return true; }
    void close() override {}
};

std::shared_ptr<Participant> make_participant() { return std::make_shared<NullParticipant>(); }

} // namespace

void testRegisterAndDisplayNames() {
    std::cout << "Testing registration..." << std::endl;

    ClientRegistry registry;
    const SessionId a = registry.register_session(make_participant(), "127.0.0.1:5000");
    const SessionId b = registry.register_session(make_participant(), "127.0.0.1:5001");
    assert(b > a && "ids increase in connect order");
    assert(registry.size() == 2);

    auto rec = registry.find(a);
    assert(rec);
    assert(!rec->username);
    assert(rec->display_name() == "User_127.0.0.1:5000");
    assert(rec->message_count == 0);

    auto users = registry.snapshot_users();
    assert(users.size() == 2);
    assert(users[0].username == "User_127.0.0.1:5000");
    assert(users[1].address == "127.0.0.1:5001");

    std::cout << "Registration test PASSED" << std::endl;
}

void testSetUsername() {
    std::cout << "Testing username changes..." << std::endl;

    ClientRegistry registry;
    const SessionId a = registry.register_session(make_participant(), "10.0.0.1:1");
    const SessionId b = registry.register_session(make_participant(), "10.0.0.2:2");

    auto r = registry.set_username(a, "  Alice ");
    assert(r.ok());
    assert(r.username == "Alice");
    assert(r.previous == "User_10.0.0.1:1");

    r = registry.set_username(a, "Alice");
    assert(r.status == UsernameStatus::Unchanged);

    r = registry.set_username(b, "Alice");
    assert(r.status == UsernameStatus::Duplicate);
    assert(r.username == "Alice");

    r = registry.set_username(b, "alice");
    assert(r.ok() && "uniqueness is an exact match");

    r = registry.set_username(b, "bad|name");
    assert(r.status == UsernameStatus::InvalidFormat);
    assert(r.reason == "Username contains invalid characters");
    assert(registry.find(b)->username == std::optional<std::string>("alice"));

    r = registry.set_username(a, "Alicia");
    assert(r.ok());
    assert(r.previous == "Alice");

    // The old name is free again
    r = registry.set_username(b, "Alice");
    assert(r.ok());

    r = registry.set_username(12345, "Nobody");
    assert(r.status == UsernameStatus::UnknownSession);

    std::cout << "Username changes test PASSED" << std::endl;
}

void testDefaultNamesAreProtected() {
    std::cout << "Testing default display name collisions..." << std::endl;

    ClientRegistry registry;
    const SessionId a = registry.register_session(make_participant(), "10.0.0.1:1");
    const SessionId b = registry.register_session(make_participant(), "10.0.0.2:2");

    auto r = registry.set_username(b, "User_10.0.0.1:1");
    assert(r.status == UsernameStatus::InvalidFormat);
    assert(r.reason == "Username is reserved");

    // Nobody holds this default yet, but a later connection from that
    // endpoint would, so the whole prefix is off limits.
    r = registry.set_username(b, "User_127.0.0.1:5000");
    assert(r.status == UsernameStatus::InvalidFormat);
    assert(!registry.find(b)->username);

    // Only the exact prefix is reserved
    r = registry.set_username(a, "Username");
    assert(r.ok());
    r = registry.set_username(b, "user_b");
    assert(r.ok());

    auto users = registry.snapshot_users();
    assert(users.size() == 2);
    assert(users[0].username == "Username");
    assert(users[1].username == "user_b");

    std::cout << "Default display name test PASSED" << std::endl;
}

void testConcurrentSameName() {
    std::cout << "Testing concurrent requests for the same name..." << std::endl;

    for (int round = 0; round < 50; ++round) {
        ClientRegistry registry;
        const SessionId a = registry.register_session(make_participant(), "10.0.0.1:1");
        const SessionId b = registry.register_session(make_participant(), "10.0.0.2:2");

        std::atomic<int> ok{0};
        std::atomic<int> duplicate{0};
        auto request = [&](SessionId id) {
            auto r = registry.set_username(id, "Alice");
            if (r.ok()) ++ok;
            if (r.status == UsernameStatus::Duplicate) ++duplicate;
        };

        std::thread t1(request, a);
        std::thread t2(request, b);
        t1.join();
        t2.join();

        assert(ok == 1);
        assert(duplicate == 1);
    }

    std::cout << "Concurrent same-name test PASSED" << std::endl;
}

void testManyThreadsUniqueNames() {
    std::cout << "Testing uniqueness under contention..." << std::endl;

    ClientRegistry registry;
    std::vector<SessionId> ids;
    for (int i = 0; i < 16; ++i) {
        ids.push_back(registry.register_session(make_participant(), "10.0.0." + std::to_string(i) + ":9"));
    }

    std::vector<std::thread> threads;
    for (SessionId id : ids) {
        threads.emplace_back([&registry, id] {
            for (int n = 0; n < 200; ++n) {
                registry.set_username(id, "name" + std::to_string(n % 8));
            }
        });
    }
    for (auto& t : threads) t.join();

    auto users = registry.snapshot_users();
    std::vector<std::string> named;
    for (const auto& u : users) {
        if (u.username.rfind("name", 0) == 0) named.push_back(u.username);
    }
    for (std::size_t i = 0; i < named.size(); ++i) {
        for (std::size_t j = i + 1; j < named.size(); ++j) {
            assert(named[i] != named[j]);
        }
    }
    assert(named.size() <= 8);

    std::cout << "Uniqueness under contention test PASSED" << std::endl;
}

void testUnregister() {
    std::cout << "Testing unregister..." << std::endl;

    ClientRegistry registry;
    const SessionId a = registry.register_session(make_participant(), "10.0.0.1:1");
    registry.set_username(a, "Alice");

    auto removed = registry.unregister(a);
    assert(removed);
    assert(removed->display_name() == "Alice");
    assert(!registry.unregister(a) && "idempotent");
    assert(registry.empty());
    assert(!registry.participant(a));

    const SessionId b = registry.register_session(make_participant(), "10.0.0.2:2");
    assert(b != a && "ids are never reused");
    assert(registry.set_username(b, "Alice").ok());

    std::cout << "Unregister test PASSED" << std::endl;
}

void testActivityTracking() {
    std::cout << "Testing activity tracking..." << std::endl;

    ClientRegistry registry;
    const SessionId a = registry.register_session(make_participant(), "10.0.0.1:1");
    const SessionId b = registry.register_session(make_participant(), "10.0.0.2:2");

    assert(registry.record_message(a));
    assert(registry.record_message(a));
    assert(registry.find(a)->message_count == 2);
    assert(!registry.record_message(999));

    const auto before = registry.find(b)->last_activity;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    assert(registry.touch(b));
    assert(registry.find(b)->last_activity > before);
    assert(!registry.touch(999));

    auto list = registry.participants();
    assert(list.size() == 2);
    assert(list[0].first == a);
    assert(list[1].first == b);

    std::cout << "Activity tracking test PASSED" << std::endl;
}

int main() {
    std::cout << "Running ClientRegistry tests..." << std::endl << std::endl;

    try {
        testRegisterAndDisplayNames();
        testSetUsername();
        testDefaultNamesAreProtected();
        testConcurrentSameName();
        testManyThreadsUniqueNames();
        testUnregister();
        testActivityTracking();

        std::cout << std::endl << "All ClientRegistry tests PASSED!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
