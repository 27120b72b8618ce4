#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "julesbot/monitor/monitor_loop.hpp"
#include "julesbot/monitor/notifier.hpp"
#include "julesbot/monitor/state_store.hpp"
#include "julesbot/monitor/stop_signal.hpp"
#include "julesbot/monitor/transition.hpp"

#include <thread>

namespace {

namespace mon = julesbot::monitor;
using julesbot::testing::FakeSessionApi;
using julesbot::testing::make_session;
using julesbot::testing::RecordingChannel;
using julesbot::testing::RecordingNotifier;

mon::MonitorOptions fast_options(const std::chrono::milliseconds interval,
                                 const std::chrono::milliseconds duration) {
  mon::MonitorOptions options;
  options.interval = interval;
  options.duration = duration;
  return options;
}

} // namespace

void register_monitor_tests(std::vector<julesbot::tests::TestCase> &tests) {
  using julesbot::tests::require;
  using std::chrono::milliseconds;

  tests.push_back({"transition_first_sight_reports_only_critical", [] {
                     const auto critical = mon::default_critical_states();
                     const auto waiting = mon::evaluate_transition(
                         "1", "Fix", "AWAITING_PLAN_APPROVAL", std::nullopt, critical);
                     require(waiting.notify, "critical first sight should notify");
                     require(waiting.notification ==
                                 mon::Notification{.session_id = "1",
                                                   .title = "Fix",
                                                   .status = "AWAITING_PLAN_APPROVAL"},
                             "notification payload mismatch");

                     const auto feedback = mon::evaluate_transition(
                         "2", "T", "AWAITING_USER_FEEDBACK", std::nullopt, critical);
                     require(feedback.notify, "second critical state should notify");

                     const auto running =
                         mon::evaluate_transition("3", "T", "IN_PROGRESS", std::nullopt, critical);
                     require(!running.notify, "non-critical first sight is silent");
                   }});

  tests.push_back({"transition_change_reports_any_status", [] {
                     const auto critical = mon::default_critical_states();
                     const auto changed = mon::evaluate_transition(
                         "1", "T", "COMPLETED", std::string("IN_PROGRESS"), critical);
                     require(changed.notify, "any change should notify");
                     require(changed.notification.status == "COMPLETED", "status mismatch");

                     const auto same = mon::evaluate_transition(
                         "1", "T", "AWAITING_PLAN_APPROVAL",
                         std::string("AWAITING_PLAN_APPROVAL"), critical);
                     require(!same.notify, "unchanged critical status is silent");

                     const auto custom = mon::evaluate_transition("9", "T", "FAILED", std::nullopt,
                                                                  mon::CriticalStates{"FAILED"});
                     require(custom.notify, "custom critical set should be honored");
                   }});

  tests.push_back({"state_store_records_and_overwrites", [] {
                     mon::SessionStateStore store;
                     require(!store.get("1").has_value(), "unknown id has no status");
                     store.record("1", "A");
                     store.record("1", "B");
                     require(store.get("1") == std::optional<std::string>("B"),
                             "latest status wins");
                     require(store.size() == 1 && store.contains("1"), "size mismatch");
                   }});

  tests.push_back({"monitor_first_poll_reports_only_new_critical", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "AWAITING_PLAN_APPROVAL", "Fix login"),
                                        make_session("2", "IN_PROGRESS", "Docs")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     const auto report = loop.poll_once();
                     require(report.fetch_ok, "fetch should succeed");
                     require(report.sessions_seen == 2, "two sessions seen");
                     require(report.notifications.size() == 1, "only the critical one notifies");
                     require(report.notifications[0].session_id == "1", "wrong session");
                     require(report.delivered, "digest should be delivered");
                     require(notifier.digests().size() == 1, "one digest per cycle");
                     require(store.get("2") == std::optional<std::string>("IN_PROGRESS"),
                             "silent sessions are still recorded");
                   }});

  tests.push_back({"monitor_status_changes_batch_into_one_digest", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "IN_PROGRESS", "A"),
                                        make_session("2", "IN_PROGRESS", "B"),
                                        make_session("3", "QUEUED", "C")});
                     api.push_sessions({make_session("1", "COMPLETED", "A"),
                                        make_session("2", "AWAITING_USER_FEEDBACK", "B"),
                                        make_session("3", "QUEUED", "C")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     const auto first = loop.poll_once();
                     require(first.notifications.empty(), "nothing critical on first cycle");
                     require(notifier.digests().empty(), "no digest without notifications");

                     const auto second = loop.poll_once();
                     require(second.notifications.size() == 2, "two sessions changed");
                     const auto digests = notifier.digests();
                     require(digests.size() == 1, "changes are batched into one digest");
                     require(digests[0][0].session_id == "1" && digests[0][1].session_id == "2",
                             "digest keeps feed order");
                     require(loop.iterations() == 2, "iteration count mismatch");
                   }});

  tests.push_back({"monitor_repeat_poll_is_idempotent", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "AWAITING_USER_FEEDBACK", "A")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     require(loop.poll_once().notifications.size() == 1, "first poll notifies");
                     require(loop.poll_once().notifications.empty(), "second poll is silent");
                     require(loop.poll_once().notifications.empty(), "third poll is silent");
                     require(notifier.digests().size() == 1, "exactly one digest overall");
                   }});

  tests.push_back({"monitor_store_keeps_sessions_that_vanish", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "IN_PROGRESS", "A")});
                     api.push_sessions({});
                     api.push_sessions({make_session("1", "IN_PROGRESS", "A")});
                     api.push_sessions({make_session("1", "COMPLETED", "A")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     (void)loop.poll_once();
                     require(loop.poll_once().sessions_seen == 0, "empty feed");
                     require(store.contains("1"), "vanished session stays in the store");
                     require(loop.poll_once().notifications.empty(),
                             "reappearing with the same status is silent");
                     require(loop.poll_once().notifications.size() == 1,
                             "later change still notifies");
                   }});

  tests.push_back({"monitor_fetch_failure_yields_no_notifications", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "IN_PROGRESS", "A")});
                     api.push_failure("list_sessions failed: HTTP 503: unavailable");
                     api.push_sessions({make_session("1", "COMPLETED", "A")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     (void)loop.poll_once();
                     const auto failed = loop.poll_once();
                     require(!failed.fetch_ok, "failure should be reported");
                     require(failed.error.find("503") != std::string::npos, "error text kept");
                     require(failed.notifications.empty(), "no notifications on failure");
                     require(store.get("1") == std::optional<std::string>("IN_PROGRESS"),
                             "store untouched on failure");

                     const auto recovered = loop.poll_once();
                     require(recovered.notifications.size() == 1,
                             "change after the failure is still reported");
                   }});

  tests.push_back({"monitor_normalizes_missing_fields", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("", "AWAITING_PLAN_APPROVAL", "no id"),
                                        make_session("5", "", ""),
                                        make_session("6", "AWAITING_PLAN_APPROVAL", "")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     const auto report = loop.poll_once();
                     require(report.sessions_seen == 2, "session without id is skipped");
                     require(store.get("5") == std::optional<std::string>("UNKNOWN"),
                             "missing state becomes UNKNOWN");
                     require(report.notifications.size() == 1, "one critical session");
                     require(report.notifications[0].title == "No Title",
                             "missing title gets a placeholder");
                   }});

  tests.push_back({"monitor_delivery_failure_is_not_fatal", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "AWAITING_PLAN_APPROVAL", "A")});
                     RecordingChannel channel;
                     channel.set_fail_sends(true);
                     mon::ChannelNotifier notifier(channel, "4242", std::chrono::hours(1));
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});

                     const auto report = loop.poll_once();
                     require(report.notifications.size() == 1, "notification collected");
                     require(!report.delivered, "delivery failure reported");
                     require(store.contains("1"), "status recorded regardless");
                   }});

  tests.push_back({"monitor_run_expires_and_sends_one_finished_notice", [] {
                     FakeSessionApi api;
                     api.push_sessions({make_session("1", "IN_PROGRESS", "A")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store,
                                           fast_options(milliseconds(10), milliseconds(80)));
                     mon::StopSignal signal;

                     const auto outcome = loop.run(signal);
                     require(outcome == mon::LoopOutcome::Expired, "run should expire");
                     require(notifier.finished_count() == 1, "exactly one finished notice");
                     require(loop.iterations() >= 2, "several cycles should run");
                     require(loop.iterations() <= 10, "cycles are bounded by the budget");
                   }});

  tests.push_back({"monitor_run_keeps_going_after_failures_and_throws", [] {
                     FakeSessionApi api;
                     api.push_failure("down");
                     api.push_throw("socket exploded");
                     api.push_sessions({make_session("1", "AWAITING_USER_FEEDBACK", "A")});
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store,
                                           fast_options(milliseconds(5), milliseconds(300)));
                     mon::StopSignal signal;

                     std::thread stopper([&]() {
                       (void)notifier.wait_for_digests(1, std::chrono::seconds(2));
                       signal.request_stop();
                     });
                     const auto outcome = loop.run(signal);
                     stopper.join();

                     require(notifier.digests().size() == 1,
                             "loop should survive failures and reach the good cycle");
                     require(api.list_calls() >= 3, "three cycles expected");
                     (void)outcome;
                   }});

  tests.push_back({"monitor_run_stop_sends_no_finished_notice", [] {
                     FakeSessionApi api;
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store,
                                           fast_options(milliseconds(1000), milliseconds(60000)));
                     mon::StopSignal signal;

                     std::thread stopper([&]() {
                       (void)api.wait_for_list_calls(1, std::chrono::seconds(2));
                       signal.request_stop();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const auto outcome = loop.run(signal);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     stopper.join();

                     require(outcome == mon::LoopOutcome::Stopped, "run should stop");
                     require(notifier.finished_count() == 0, "stop sends no finished notice");
                     require(elapsed < std::chrono::seconds(5), "stop should cut the sleep short");
                     require(loop.iterations() == 1, "one cycle before the stop");
                   }});

  tests.push_back({"monitor_run_pre_stopped_does_nothing", [] {
                     FakeSessionApi api;
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store, mon::MonitorOptions{});
                     mon::StopSignal signal;
                     signal.request_stop();

                     require(loop.run(signal) == mon::LoopOutcome::Stopped, "already stopped");
                     require(api.list_calls() == 0, "no fetch after a stop");
                   }});

  tests.push_back({"monitor_expiry_hook_can_suppress_notice", [] {
                     FakeSessionApi api;
                     RecordingNotifier notifier;
                     mon::SessionStateStore store;
                     mon::MonitorLoop loop(api, notifier, store,
                                           fast_options(milliseconds(5), milliseconds(20)));
                     mon::StopSignal signal;
                     int hook_calls = 0;

                     const auto outcome = loop.run(signal, [&]() {
                       ++hook_calls;
                       return false;
                     });
                     require(outcome == mon::LoopOutcome::Expired, "run should expire");
                     require(hook_calls == 1, "hook runs once");
                     require(notifier.finished_count() == 0, "hook suppressed the notice");
                   }});

  tests.push_back({"stop_signal_wait_for", [] {
                     mon::StopSignal signal;
                     require(!signal.wait_for(milliseconds(5)), "timeout without stop");
                     std::thread stopper([&]() {
                       std::this_thread::sleep_for(milliseconds(10));
                       signal.request_stop();
                     });
                     require(signal.wait_for(std::chrono::seconds(5)), "stop should wake waiter");
                     stopper.join();
                     require(signal.stop_requested(), "flag stays set");
                   }});

  tests.push_back({"notifier_digest_shortens_long_titles", [] {
                     std::vector<mon::Notification> updates;
                     for (int i = 0; i < 10; ++i) {
                       updates.push_back({.session_id = std::to_string(i),
                                          .title = std::string(450, 'x'),
                                          .status = "AWAITING_USER_FEEDBACK"});
                     }
                     const auto digest = mon::format_digest(updates);
                     require(digest.size() <= mon::DIGEST_TEXT_LIMIT,
                             "digest too long: " + std::to_string(digest.size()));
                     for (int i = 0; i < 10; ++i) {
                       require(digest.find("(<code>" + std::to_string(i) + "</code>)") !=
                                   std::string::npos,
                               "every update should still be listed");
                     }
                     require(digest.find(std::string(mon::DIGEST_TITLE_LIMIT, 'x') + "...") !=
                                 std::string::npos,
                             "long titles end in an ellipsis");
                     require(digest.find(std::string(mon::DIGEST_TITLE_LIMIT + 1, 'x')) ==
                                 std::string::npos,
                             "titles are cut at the title limit");
                   }});

  tests.push_back({"notifier_digest_drops_whole_entries_past_limit", [] {
                     std::vector<mon::Notification> updates;
                     for (int i = 0; i < 40; ++i) {
                       updates.push_back({.session_id = std::to_string(i),
                                          .title = std::string(150, '<'),
                                          .status = "COMPLETED"});
                     }
                     const auto digest = mon::format_digest(updates);
                     require(digest.size() <= mon::DIGEST_TEXT_LIMIT,
                             "digest too long: " + std::to_string(digest.size()));
                     require(digest.rfind("<b>Updates:</b>\nSession: ", 0) == 0,
                             "header and first entry kept");
                     const auto tail = digest.rfind("\n... and ");
                     require(tail != std::string::npos, "overflow line expected");
                     require(digest.compare(digest.size() - 5, 5, " more") == 0,
                             "overflow line ends the digest");
                     require(digest.find("\nStatus: <b>COMPLETED</b>\n... and ") != std::string::npos,
                             "cut happens at an entry boundary");

                     std::size_t listed = 0;
                     for (auto pos = digest.find("Session: "); pos != std::string::npos;
                          pos = digest.find("Session: ", pos + 1)) {
                       ++listed;
                     }
                     const std::string omitted = std::to_string(40 - listed);
                     julesbot::tests::require_text(digest.substr(tail),
                                                   "\n... and " + omitted + " more",
                                                   "overflow line");
                   }});

  tests.push_back({"channel_notifier_sends_bounded_digest", [] {
                     RecordingChannel channel;
                     mon::ChannelNotifier notifier(channel, "4242", std::chrono::hours(1));
                     std::vector<mon::Notification> updates;
                     for (int i = 0; i < 100; ++i) {
                       updates.push_back({.session_id = std::to_string(i),
                                          .title = std::string(300, 'T'),
                                          .status = "AWAITING_PLAN_APPROVAL"});
                     }
                     require(notifier.send_digest(updates).ok(), "send should succeed");
                     const auto sent = channel.sent();
                     require(sent.size() == 1, "still one message per cycle");
                     require(sent[0].text.size() <= mon::DIGEST_TEXT_LIMIT,
                             "sent digest fits in one message");
                   }});

  tests.push_back({"notifier_formats_digest_and_finished", [] {
                     const std::vector<mon::Notification> updates = {
                         {.session_id = "1", .title = "Fix <html>", .status = "COMPLETED"},
                         {.session_id = "2", .title = "B", .status = "AWAITING_USER_FEEDBACK"}};
                     require(mon::format_notification(updates[0]) ==
                                 "Session: Fix &lt;html&gt; (<code>1</code>)\nStatus: <b>COMPLETED</b>",
                             "entry mismatch: " + mon::format_notification(updates[0]));
                     const auto digest = mon::format_digest(updates);
                     require(digest.rfind("<b>Updates:</b>\nSession: Fix", 0) == 0,
                             "digest header mismatch: " + digest);
                     require(digest.find("\nSession: B (<code>2</code>)") != std::string::npos,
                             "second entry on its own line");
                     require(mon::format_finished(std::chrono::hours(1)) ==
                                 "Monitoring finished (1 hour completed).",
                             "finished text mismatch");
                   }});

  tests.push_back({"notifier_describes_spans", [] {
                     require(mon::describe_span(std::chrono::hours(2)) == "2 hours", "hours");
                     require(mon::describe_span(std::chrono::minutes(30)) == "30 minutes",
                             "minutes");
                     require(mon::describe_span(std::chrono::seconds(1)) == "1 second", "second");
                     require(mon::describe_span(milliseconds(250)) == "250 milliseconds", "ms");
                     require(mon::describe_interval(std::chrono::minutes(1)) == "every minute",
                             "every minute");
                     require(mon::describe_interval(std::chrono::seconds(30)) ==
                                 "every 30 seconds",
                             "every 30 seconds");
                   }});

  tests.push_back({"channel_notifier_sends_to_destination", [] {
                     RecordingChannel channel;
                     mon::ChannelNotifier notifier(channel, "4242", std::chrono::minutes(30));

                     require(notifier.send_digest({}).ok(), "empty digest is a no-op");
                     require(channel.sent().empty(), "empty digest sends nothing");

                     require(notifier
                                 .send_digest({{.session_id = "1", .title = "A", .status = "X"}})
                                 .ok(),
                             "digest send");
                     require(notifier.send_finished().ok(), "finished send");

                     const auto sent = channel.sent();
                     require(sent.size() == 2, "two messages");
                     require(sent[0].recipient == "4242" && sent[1].recipient == "4242",
                             "fixed destination");
                     require(sent[0].format == julesbot::channels::TextFormat::Html,
                             "digest is html");
                     require(sent[1].text == "Monitoring finished (30 minutes completed).",
                             "finished text uses the configured budget");
                   }});
}
