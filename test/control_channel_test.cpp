// =============================================================================
// control_channel_test.cpp — control messages and the session's run slot
// =============================================================================

#include "harness.hpp"
#include "core/control_channel.hpp"
#include "sessions/pty_session.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace pty;

static std::string Describe(const ControlMessage &msg)
{
    if (auto *in = std::get_if<InputMessage>(&msg))
        return "input:" + in->data;
    if (auto *rs = std::get_if<ResizeMessage>(&msg))
        return "resize:" + std::to_string(rs->cols) + "x" + std::to_string(rs->rows);
    return "kill";
}

static void testChannel()
{
    std::cout << "\n--- ControlChannel ---\n";

    runTest("messages drain in send order", []()
            {
        ControlChannel ch;
        XASSERT(ch.Send(InputMessage{"ls\n"}).has_value());
        XASSERT(ch.Send(ResizeMessage{80, 24}).has_value());
        XASSERT(ch.Send(KillMessage{}).has_value());

        std::vector<std::string> seen;
        auto n = ch.Drain([&](ControlMessage &m) { seen.push_back(Describe(m)); });
        XASSERT_EQ(n, 3u);
        XASSERT_EQ(seen.size(), 3u);
        XASSERT_EQ(seen[0], std::string("input:ls\n"));
        XASSERT_EQ(seen[1], std::string("resize:80x24"));
        XASSERT_EQ(seen[2], std::string("kill")); });

    runTest("drain of an empty channel consumes nothing", []()
            {
        ControlChannel ch;
        int calls = 0;
        XASSERT_EQ(ch.Drain([&](ControlMessage &) { ++calls; }), 0u);
        XASSERT_EQ(calls, 0); });

    runTest("send after close reports session_gone", []()
            {
        ControlChannel ch;
        XASSERT(!ch.Closed());
        ch.Close();
        XASSERT(ch.Closed());
        auto st = ch.Send(KillMessage{});
        XASSERT(!st.has_value());
        XASSERT(st.error() == make_error_code(errc::session_gone)); });

    runTest("a burst of input followed by kill is accepted in order", []()
            {
        ControlChannel ch;
        for (int i = 0; i < 3000; ++i)
            XASSERT(ch.Send(InputMessage{"line\n"}).has_value());
        XASSERT(ch.Send(KillMessage{}).has_value());

        std::size_t inputs = 0;
        std::string last;
        auto n = ch.Drain([&](ControlMessage &m) {
            if (std::holds_alternative<InputMessage>(m))
                ++inputs;
            last = Describe(m);
        });
        XASSERT_EQ(n, 3001u);
        XASSERT_EQ(inputs, 3000u);
        XASSERT_EQ(last, std::string("kill")); });

    runTest("messages sent during a drain wait for the next one", []()
            {
        ControlChannel ch;
        XASSERT(ch.Send(InputMessage{"a"}).has_value());
        std::vector<std::string> seen;
        auto n = ch.Drain([&](ControlMessage &m) {
            seen.push_back(Describe(m));
            XASSERT(ch.Send(InputMessage{"b"}).has_value());
        });
        XASSERT_EQ(n, 1u);
        ch.Drain([&](ControlMessage &m) { seen.push_back(Describe(m)); });
        XASSERT_EQ(seen.size(), 2u);
        XASSERT_EQ(seen[1], std::string("input:b")); });
}

static void testSlot()
{
    std::cout << "\n--- RunSlot / RunSlotLease ---\n";

    runTest("send with no run installed reports not_running", []()
            {
        RunSlot slot;
        XASSERT(!slot.Occupied());
        auto st = slot.Send(KillMessage{});
        XASSERT(!st.has_value());
        XASSERT(st.error() == make_error_code(errc::not_running)); });

    runTest("second install reports already_running", []()
            {
        RunSlot slot;
        XASSERT(slot.TryInstall(std::make_shared<ControlChannel>()).has_value());
        auto st = slot.TryInstall(std::make_shared<ControlChannel>());
        XASSERT(!st.has_value());
        XASSERT(st.error() == make_error_code(errc::already_running));
        XASSERT(slot.Clear().has_value());
        XASSERT(slot.TryInstall(std::make_shared<ControlChannel>()).has_value()); });

    runTest("send reaches the installed channel", []()
            {
        RunSlot slot;
        auto ch = std::make_shared<ControlChannel>();
        XASSERT(slot.TryInstall(ch).has_value());
        XASSERT(slot.Send(ResizeMessage{100, 30}).has_value());
        std::string seen;
        ch->Drain([&](ControlMessage &m) { seen = Describe(m); });
        XASSERT_EQ(seen, std::string("resize:100x30")); });

    runTest("closed channel in the slot reports session_gone", []()
            {
        RunSlot slot;
        auto ch = std::make_shared<ControlChannel>();
        XASSERT(slot.TryInstall(ch).has_value());
        ch->Close();
        auto st = slot.Send(InputMessage{"late"});
        XASSERT(!st.has_value());
        XASSERT(st.error() == make_error_code(errc::session_gone)); });

    runTest("lease clears the slot on destruction", []()
            {
        auto slot = std::make_shared<RunSlot>();
        {
            auto lease = RunSlotLease::Acquire(slot, std::make_shared<ControlChannel>());
            XASSERT(lease.has_value());
            XASSERT(slot->Occupied());

            auto second = RunSlotLease::Acquire(slot, std::make_shared<ControlChannel>());
            XASSERT(!second.has_value());
            XASSERT(second.error() == make_error_code(errc::already_running));
            XASSERT(slot->Occupied());
        }
        XASSERT(!slot->Occupied());
        XASSERT(slot->Send(KillMessage{}).error() == make_error_code(errc::not_running)); });

    runTest("moved-from lease does not clear twice", []()
            {
        auto slot = std::make_shared<RunSlot>();
        auto lease = RunSlotLease::Acquire(slot, std::make_shared<ControlChannel>());
        XASSERT(lease.has_value());
        {
            RunSlotLease moved(std::move(*lease));
            XASSERT(slot->Occupied());
        }
        XASSERT(!slot->Occupied());
        XASSERT(slot->TryInstall(std::make_shared<ControlChannel>()).has_value()); });
}

// Channel whose Send throws while the slot lock is held.
struct ThrowingChannel
{
    Status Send(ControlMessage)
    {
        throw std::runtime_error("send failed");
    }
};

static void testPoison()
{
    std::cout << "\n--- Lock poisoning ---\n";

    runTest("exception under the slot lock poisons every later call", []()
            {
        BasicRunSlot<ThrowingChannel> slot;
        XASSERT(slot.TryInstall(std::make_shared<ThrowingChannel>()).has_value());

        bool thrown = false;
        try
        {
            (void)slot.Send(KillMessage{});
        }
        catch (const std::runtime_error &)
        {
            thrown = true;
        }
        XASSERT(thrown);

        const auto poisoned = make_error_code(errc::lock_poisoned);
        XASSERT(slot.TryInstall(std::make_shared<ThrowingChannel>()).error() == poisoned);
        XASSERT(slot.Send(InputMessage{"x"}).error() == poisoned);
        XASSERT(slot.Clear().error() == poisoned);
        XASSERT(!slot.Occupied()); });
}

static void testErrors()
{
    std::cout << "\n--- Error codes ---\n";

    runTest("errors carry the ptyrun category and a message", []()
            {
        boost::system::error_code ec = errc::already_running;
        XASSERT_EQ(std::string(ec.category().name()), std::string("ptyrun"));
        XASSERT_EQ(ec.message(), std::string("PTY session already running"));
        XASSERT(make_error_code(errc::not_running) != make_error_code(errc::session_gone)); });
}

int main()
{
    banner("Control Channel Tests");

    testChannel();
    testSlot();
    testPoison();
    testErrors();

    return finish();
}
