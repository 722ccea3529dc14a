#pragma once

namespace lendcore::tests {

void test_event_log();
void test_event_journal_round_trip();
void test_event_journal_detects_corruption();
void test_event_journal_paths();

}  // namespace lendcore::tests
