#include "autosplit_sdk/dispatcher.hpp"
#include "simulated_host.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

using autosplit::HostAction;
using autosplit::SimulatedHost;
using autosplit_sdk::Dispatcher;
using autosplit_sdk::HostFunctions;
using autosplit_sdk::ISplitter;
using autosplit_sdk::Process;

namespace {

// Counts constructions and ticks
struct CountingSplitter {
    static int constructed;

    explicit CountingSplitter(HostFunctions& host) {
        ++constructed;
        host.set_variable("constructed", std::to_string(constructed));
    }

    void update(HostFunctions& host) {
        ++ticks;
        host.split();
    }

    int ticks = 0;
};
int CountingSplitter::constructed = 0;

struct DefaultSplitter {
    void update(HostFunctions& host) { host.start(); }
};

class VirtualSplitter : public ISplitter {
public:
    void update(HostFunctions& host) override { host.set_variable("virtual", "yes"); }
};

struct ThrowingSplitter {
    void update(HostFunctions&) { throw std::runtime_error("bad pointer path"); }
};

// Throws from the constructor until allowed
struct FlakyConstructSplitter {
    static bool allow;

    FlakyConstructSplitter() {
        if (!allow) throw std::runtime_error("not ready");
    }
    void update(HostFunctions&) {}
};
bool FlakyConstructSplitter::allow = false;

// Calls back into its own dispatcher while a tick is running
struct ReentrantSplitter {
    static Dispatcher<ReentrantSplitter>* dispatcher;

    void update(HostFunctions& host) {
        ++depth;
        host.start();
        dispatcher->update();
        --depth;
    }

    int depth = 0;
};
Dispatcher<ReentrantSplitter>* ReentrantSplitter::dispatcher = nullptr;

// Tries to tear down and rebuild its own dispatcher mid-tick
struct SelfDestroyingSplitter {
    static Dispatcher<SelfDestroyingSplitter>* dispatcher;
    static const AutosplitHostApi* bindings;

    void update(HostFunctions& host) {
        dispatcher->destroy();
        reconstructed = dispatcher->construct(bindings);
        // Still alive and still bound to the host
        host.set_variable("after_destroy", "alive");
        ++ticks;
    }

    bool reconstructed = true;
    int ticks = 0;
};
Dispatcher<SelfDestroyingSplitter>* SelfDestroyingSplitter::dispatcher = nullptr;
const AutosplitHostApi* SelfDestroyingSplitter::bindings = nullptr;

struct AttachingSplitter {
    explicit AttachingSplitter(HostFunctions& host) : process(host.attach("Game.exe")) {}
    void update(HostFunctions&) {}

    std::optional<Process> process;
};

bool has_message_containing(const SimulatedHost& host, const std::string& needle) {
    for (const auto& message : host.get_messages()) {
        if (message.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

TEST(DispatcherTest, ConstructsOnceAndTicks) {
    CountingSplitter::constructed = 0;
    SimulatedHost host;
    Dispatcher<CountingSplitter> dispatcher;

    ASSERT_TRUE(dispatcher.construct(host.api()));
    EXPECT_TRUE(dispatcher.is_bound());
    EXPECT_TRUE(dispatcher.has_instance());
    EXPECT_EQ(host.get_variable("constructed"), "1");

    dispatcher.update();
    dispatcher.update();
    EXPECT_EQ(dispatcher.instance()->ticks, 2);
    EXPECT_EQ(dispatcher.get_tick_count(), 2u);
    EXPECT_EQ(CountingSplitter::constructed, 1);
    EXPECT_EQ(host.get_requested_actions().size(), 2u);
}

TEST(DispatcherTest, SecondConstructFails) {
    CountingSplitter::constructed = 0;
    SimulatedHost host;
    Dispatcher<CountingSplitter> dispatcher;

    ASSERT_TRUE(dispatcher.construct(host.api()));
    EXPECT_FALSE(dispatcher.construct(host.api()));
    EXPECT_EQ(CountingSplitter::constructed, 1);
    EXPECT_TRUE(has_message_containing(host, "already live"));
}

TEST(DispatcherTest, ConstructAgainAfterDestroy) {
    CountingSplitter::constructed = 0;
    SimulatedHost host;
    Dispatcher<CountingSplitter> dispatcher;

    ASSERT_TRUE(dispatcher.construct(host.api()));
    dispatcher.destroy();
    EXPECT_FALSE(dispatcher.is_bound());
    EXPECT_FALSE(dispatcher.has_instance());

    ASSERT_TRUE(dispatcher.construct(host.api()));
    EXPECT_EQ(CountingSplitter::constructed, 2);
}

TEST(DispatcherTest, RejectsUnusableBindings) {
    Dispatcher<DefaultSplitter> dispatcher;
    EXPECT_FALSE(dispatcher.construct(nullptr));

    SimulatedHost host;
    AutosplitHostApi wrong_version = *host.api();
    wrong_version.api_version = AUTOSPLIT_API_VERSION + 1;
    EXPECT_FALSE(dispatcher.construct(&wrong_version));

    AutosplitHostApi incomplete = *host.api();
    incomplete.process_read = nullptr;
    EXPECT_FALSE(dispatcher.construct(&incomplete));

    EXPECT_FALSE(dispatcher.is_bound());
    EXPECT_FALSE(dispatcher.has_instance());
}

TEST(DispatcherTest, UpdateBeforeConstructIsIgnored) {
    Dispatcher<DefaultSplitter> dispatcher;
    dispatcher.update();
    EXPECT_FALSE(dispatcher.has_instance());
    EXPECT_EQ(dispatcher.get_tick_count(), 0u);
}

TEST(DispatcherTest, DefaultConstructibleSplitter) {
    SimulatedHost host;
    Dispatcher<DefaultSplitter> dispatcher;

    ASSERT_TRUE(dispatcher.construct(host.api()));
    dispatcher.update();
    EXPECT_EQ(host.get_requested_actions(), std::vector<HostAction>{HostAction::Start});
}

TEST(DispatcherTest, VirtualSplitter) {
    SimulatedHost host;
    Dispatcher<VirtualSplitter> dispatcher;

    ASSERT_TRUE(dispatcher.construct(host.api()));
    dispatcher.update();
    EXPECT_EQ(host.get_variable("virtual"), "yes");
}

TEST(DispatcherTest, ExceptionInUpdateIsContained) {
    SimulatedHost host;
    Dispatcher<ThrowingSplitter> dispatcher;
    ASSERT_TRUE(dispatcher.construct(host.api()));

    EXPECT_NO_THROW(dispatcher.update());
    EXPECT_TRUE(has_message_containing(host, "[ERROR] exception in update: bad pointer path"));

    // The next tick still runs
    EXPECT_FALSE(dispatcher.is_updating());
    EXPECT_NO_THROW(dispatcher.update());
    EXPECT_EQ(dispatcher.get_tick_count(), 2u);
}

TEST(DispatcherTest, FailedConstructIsRetriedOnUpdate) {
    FlakyConstructSplitter::allow = false;
    SimulatedHost host;
    Dispatcher<FlakyConstructSplitter> dispatcher;

    EXPECT_FALSE(dispatcher.construct(host.api()));
    EXPECT_TRUE(dispatcher.is_bound());
    EXPECT_FALSE(dispatcher.has_instance());
    EXPECT_TRUE(has_message_containing(host, "exception in construct: not ready"));

    dispatcher.update();
    EXPECT_FALSE(dispatcher.has_instance());
    EXPECT_EQ(dispatcher.get_tick_count(), 0u);

    FlakyConstructSplitter::allow = true;
    dispatcher.update();
    EXPECT_TRUE(dispatcher.has_instance());
    EXPECT_EQ(dispatcher.get_tick_count(), 1u);
}

TEST(DispatcherTest, ReentrantUpdateIsRefused) {
    SimulatedHost host;
    Dispatcher<ReentrantSplitter> dispatcher;
    ReentrantSplitter::dispatcher = &dispatcher;

    ASSERT_TRUE(dispatcher.construct(host.api()));
    dispatcher.update();

    // Only the outer tick ran
    EXPECT_EQ(host.get_requested_actions().size(), 1u);
    EXPECT_EQ(dispatcher.get_tick_count(), 1u);
    EXPECT_EQ(dispatcher.instance()->depth, 0);
    EXPECT_TRUE(has_message_containing(host, "re-entered"));
    EXPECT_FALSE(dispatcher.is_updating());

    ReentrantSplitter::dispatcher = nullptr;
}

TEST(DispatcherTest, DestroyDetachesProcess) {
    SimulatedHost host;
    host.processes().add("Game.exe", 7);

    Dispatcher<AttachingSplitter> dispatcher;
    ASSERT_TRUE(dispatcher.construct(host.api()));
    ASSERT_TRUE(dispatcher.instance()->process.has_value());
    EXPECT_EQ(host.get_attached_count(), 1u);

    dispatcher.destroy();
    EXPECT_EQ(host.get_attached_count(), 0u);
    EXPECT_EQ(host.get_detach_count(), 1u);
}

TEST(DispatcherTest, BindingsAreCopied) {
    CountingSplitter::constructed = 0;
    SimulatedHost host;
    Dispatcher<CountingSplitter> dispatcher;

    {
        AutosplitHostApi temporary = *host.api();
        ASSERT_TRUE(dispatcher.construct(&temporary));
    }
    dispatcher.update();
    EXPECT_EQ(host.get_requested_actions().size(), 1u);
}

TEST(DispatcherTest, DestroyAndConstructDuringTickAreRefused) {
    SimulatedHost host;
    Dispatcher<SelfDestroyingSplitter> dispatcher;
    SelfDestroyingSplitter::dispatcher = &dispatcher;
    SelfDestroyingSplitter::bindings = host.api();

    ASSERT_TRUE(dispatcher.construct(host.api()));
    dispatcher.update();

    EXPECT_TRUE(dispatcher.has_instance());
    EXPECT_TRUE(dispatcher.is_bound());
    EXPECT_EQ(dispatcher.instance()->ticks, 1);
    EXPECT_FALSE(dispatcher.instance()->reconstructed);
    EXPECT_EQ(host.get_variable("after_destroy"), "alive");
    EXPECT_TRUE(has_message_containing(host, "destroy called while a tick is running"));
    EXPECT_TRUE(has_message_containing(host, "construct called while a tick is running"));

    // Outside a tick destroy works as usual
    dispatcher.destroy();
    EXPECT_FALSE(dispatcher.has_instance());

    SelfDestroyingSplitter::dispatcher = nullptr;
    SelfDestroyingSplitter::bindings = nullptr;
}
