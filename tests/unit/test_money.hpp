#pragma once

namespace payledger::tests {

void test_money_to_string();
void test_money_checked_arithmetic();

}  // namespace payledger::tests
