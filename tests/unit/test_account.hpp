#pragma once

namespace payledger::tests {

void test_account_deposit_withdraw();
void test_account_dispute_lifecycle();
void test_account_overflow_leaves_state();

}  // namespace payledger::tests
