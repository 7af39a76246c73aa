#include "app/HudPresenter.h"

#include "session/MatchSession.h"

#include <iostream>
#include <memory>
#include <string>

namespace
{

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

MatchFrame huntFrame()
{
    MatchFrame frame;
    frame.localId = "p1";
    frame.phase = GamePhase::Hunt;
    frame.round.currentRound = 1;
    frame.round.totalRounds = 2;
    frame.round.clockRemainingMs = 65000.0;
    frame.trapInventory = 1;
    return frame;
}

bool testPhaseAndRoleLines()
{
    HudPresenter presenter(CollectibleConfig{}, CapabilityFlags{});
    MatchFrame frame = huntFrame();

    bool success = true;
    HudModel model = presenter.present(frame);
    success &= assertTrue(model.phaseLine == "Round 1/2  Hunt  01:05", "Hunt line should show round and clock");
    success &= assertTrue(model.roleLine == "Run!", "Runners should be told to run");
    success &= assertTrue(model.inventoryLine == "Traps 1/3", "Inventory should show the cap");
    success &= assertTrue(model.staminaLine.empty(), "Stamina is hidden without the capability");
    success &= assertTrue(model.banner.empty(), "No banner during a normal hunt");

    frame.localChaser = true;
    frame.invulnerable = true;
    model = presenter.present(frame);
    success &= assertTrue(model.roleLine == "You are the chaser  (protected)", "Chaser role should note protection");

    frame.phase = GamePhase::Lobby;
    frame.round = RoundContext{};
    model = presenter.present(frame);
    success &= assertTrue(model.phaseLine == "Lobby" && model.roleLine.empty(), "Lobby shows no round or role");

    success &= assertTrue(HudPresenter::formatClock(1.0) == "00:01", "Partial seconds round up");
    success &= assertTrue(HudPresenter::formatClock(-5.0) == "00:00", "Negative clocks clamp to zero");
    return success;
}

bool testBannersAndQuiz()
{
    HudPresenter presenter(CollectibleConfig{}, CapabilityFlags{});
    MatchFrame frame = huntFrame();
    frame.phase = GamePhase::FrozenLocal;
    frame.penaltyQuizLoading = true;
    frame.connectionLost = true;

    bool success = true;
    success &= assertTrue(presenter.present(frame).banner == "Connection lost, rejoining...",
                          "Connection loss outranks every other banner");
    frame.connectionLost = false;
    success &= assertTrue(presenter.present(frame).banner == "Frozen! Loading penalty quiz...",
                          "Loading banner while quiz content is missing");
    frame.penaltyQuizLoading = false;
    success &= assertTrue(presenter.present(frame).banner == "Frozen! Answer with 1-4 to thaw",
                          "Frozen banner once the quiz is ready");

    QuizPrompt quiz;
    quiz.question = "2 + 2?";
    quiz.options = {"3", "4"};
    frame.quiz = quiz;
    success &= assertTrue(presenter.present(frame).quizLines.empty(), "Quiz lines only show in the quiz phase");
    frame.phase = GamePhase::Quiz;
    const HudModel model = presenter.present(frame);
    success &= assertTrue(model.quizLines.size() == 3 && model.quizLines[0] == "2 + 2?" && model.quizLines[2] == "2) 4",
                          "Quiz lines should number the options");
    return success;
}

bool testScoreboardAndStamina()
{
    CapabilityFlags capabilities;
    capabilities.stamina = true;
    HudPresenter presenter(CollectibleConfig{}, capabilities);
    MatchFrame frame = huntFrame();
    RemoteEntity bot;
    bot.id = "p2";
    bot.name = "Bot";
    frame.remotes.push_back(bot);
    frame.scores = {{"p1", 3}, {"p2", 5}, {"p3", 3}};
    frame.stamina = 0.456f;

    const HudModel model = presenter.present(frame);
    bool success = true;
    success &= assertTrue(model.scoreLines.size() == 3, "Every scorer should be listed");
    success &= assertTrue(model.scoreLines.size() == 3 && model.scoreLines[0] == "Bot  5" &&
                              model.scoreLines[1] == "You  3" && model.scoreLines[2] == "p3  3",
                          "Scores sort by value then name");
    success &= assertTrue(model.staminaLine == "Stamina 46%", "Stamina should show as a percentage");
    return success;
}

bool testToastsFromBus()
{
    auto bus = std::make_shared<BasicEventBus>();
    HudPresenter presenter(CollectibleConfig{}, CapabilityFlags{});
    presenter.setEventBus(bus);
    MatchFrame frame = huntFrame();

    EventContext started;
    started.payload = PhaseChangedEvent{GamePhase::Quiz, GamePhase::Hunt, 1};
    bus->dispatch(PhaseChangedEventName, started);
    bus->pump();

    bool success = true;
    frame.nowMs = 1000.0;
    success &= assertTrue(presenter.present(frame).toast == "Round 1 hunt!", "Hunt start should toast");
    frame.nowMs = 2999.0;
    success &= assertTrue(presenter.present(frame).toast == "Round 1 hunt!", "Toast should last two seconds");
    frame.nowMs = 3000.0;
    success &= assertTrue(presenter.present(frame).toast.empty(), "Toast should expire");

    EventContext thawed;
    thawed.payload = PhaseChangedEvent{GamePhase::FrozenLocal, GamePhase::Hunt, 1};
    bus->dispatch(PhaseChangedEventName, thawed);
    bus->pump();
    success &= assertTrue(presenter.present(frame).toast.empty(), "Thawing must not re-announce the hunt");

    EventContext lobby;
    lobby.payload = RouteToLobbyEvent{"room_closed"};
    bus->dispatch(RouteToLobbyEventName, lobby);
    bus->pump();
    success &= assertTrue(presenter.present(frame).toast == "Returned to lobby (room_closed)",
                          "Lobby routing should toast the reason");
    return success;
}

bool testLostEventsWarning()
{
    auto bus = std::make_shared<BasicEventBus>();
    bus->setExpiryFrames(1);
    HudPresenter presenter(CollectibleConfig{}, CapabilityFlags{});
    presenter.setEventBus(bus);
    for (int i = 0; i < 10; ++i)
    {
        bus->dispatch("orphan", EventContext{});
    }
    bus->advanceFrame();

    const HudModel model = presenter.present(huntFrame());
    bool success = true;
    success &= assertTrue(model.unconsumedEvents == 10, "Unconsumed count should be surfaced");
    success &= assertTrue(model.warning == "Events lost 10", "Lost events should raise a warning");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testPhaseAndRoleLines();
    success &= testBannersAndQuiz();
    success &= testScoreboardAndStamina();
    success &= testToastsFromBus();
    success &= testLostEventsWarning();
    return success ? 0 : 1;
}
