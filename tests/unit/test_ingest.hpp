#pragma once

namespace payledger::tests {

void test_parse_amount();
void test_csv_reader();
void test_record_decoder();
void test_record_conversion();

}  // namespace payledger::tests
