// Format detection, encoding ladder, date/amount parsing and CSV normalization

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "ingest/csv_normalizer.hpp"
#include "ingest/field_parsers.hpp"
#include "ingest/format_detector.hpp"
#include "ingest/text_decoder.hpp"
#include "utils/logger.hpp"

using namespace ledgerflow;

static std::vector<char> bytes(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}

static bool approx(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static Date date_of(const std::string& text, int fallback_year = 0) {
    Date d;
    if (!parse_date(text, d, fallback_year)) return Date{};
    return d;
}

static double amount_of(const std::string& text) {
    double v = 0.0;
    assert(parse_amount(text, v));
    return v;
}

int main() {
    g_log_level = LogLevel::ERROR;
    std::cout << "Running ingest tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: format detection... ";
        try {
            auto pdf = detect_format(bytes("%PDF-1.7\n%binary"), "statement.bin");
            assert(pdf.status.ok() && pdf.format == StatementFormat::PDF);

            auto csv = detect_format(bytes("date,description,amount\n"), "export.dat");
            assert(csv.status.ok() && csv.format == StatementFormat::CSV);

            auto by_ext = detect_format(bytes("just some text\n"), "notes.csv");
            assert(by_ext.status.ok() && by_ext.format == StatementFormat::CSV);

            std::string binary("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
            auto png = detect_format(bytes(binary), "image.png");
            assert(png.status.kind == ErrorKind::UNSUPPORTED_FORMAT);

            auto fake_pdf = detect_format(bytes("date,amount\n"), "statement.pdf");
            assert(fake_pdf.status.kind == ErrorKind::UNSUPPORTED_FORMAT);

            auto plain = detect_format(bytes("hello world\n"), "readme");
            assert(plain.status.kind == ErrorKind::UNSUPPORTED_FORMAT);

            auto empty = detect_format({}, "empty.csv");
            assert(empty.status.kind == ErrorKind::UNSUPPORTED_FORMAT);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: encoding ladder... ";
        try {
            auto utf8 = decode_text(bytes("Caf\xC3\xA9"));
            assert(utf8.status.ok() && utf8.encoding == "utf-8");
            assert(utf8.text == "Caf\xC3\xA9");
            assert(utf8.attempted.size() == 1);

            auto bom = decode_text(bytes("\xEF\xBB\xBF" "date"));
            assert(bom.status.ok() && bom.encoding == "utf-8-sig");
            assert(bom.text == "date");

            auto latin1 = decode_text(bytes("Caf\xE9"));
            assert(latin1.status.ok() && latin1.encoding == "latin-1");
            assert(latin1.text == "Caf\xC3\xA9");

            // 0x80 is the euro sign in cp1252 and a C1 control in latin-1
            auto cp1252 = decode_text(bytes("\x80" "5"));
            assert(cp1252.status.ok() && cp1252.encoding == "cp1252");
            assert(cp1252.text == "\xE2\x82\xAC" "5");

            // 0x81 is undefined in cp1252, so the latin-1 decode is kept
            auto undefined = decode_text(bytes(
                "date,description,amount\n2024-01-02,Caf\xE9 \x81 Paris,-5.00\n"));
            assert(undefined.status.ok() && undefined.encoding == "latin-1");
            assert(undefined.attempted.size() == 4);
            assert(undefined.text.find("Caf\xC3\xA9 \xC2\x81 Paris") != std::string::npos);

            // NUL bytes fail every rung
            auto bad = decode_text(bytes(std::string("\xFF\x00" "A", 3)));
            assert(bad.status.kind == ErrorKind::ENCODING_ERROR);
            assert(bad.attempted.size() == 4);
            assert(bad.status.message.find("cp1252") != std::string::npos);
            assert(bad.status.message.find("latin-1") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: date formats... ";
        try {
            assert(date_of("2024-01-15").iso() == "2024-01-15");
            assert(date_of("2024/01/15").iso() == "2024-01-15");
            assert(date_of("01/15/2024").iso() == "2024-01-15");
            assert(date_of("15/01/2024").iso() == "2024-01-15");
            assert(date_of("01/02/2024").iso() == "2024-01-02");   // US before EU
            assert(date_of("15.01.2024").iso() == "2024-01-15");
            assert(date_of("01/15/24").iso() == "2024-01-15");
            assert(date_of("Jan 15, 2024").iso() == "2024-01-15");
            assert(date_of("15 Jan 2024").iso() == "2024-01-15");
            assert(date_of("15-Jan-2024").iso() == "2024-01-15");
            assert(date_of("2024-01-15 10:30:00").iso() == "2024-01-15");
            assert(date_of("2024-02-29").iso() == "2024-02-29");

            assert(!date_of("2024-02-30").valid());
            assert(!date_of("2023-02-29").valid());
            assert(!date_of("yesterday").valid());
            assert(!date_of("").valid());
            assert(!date_of("01/15").valid());
            assert(date_of("01/15", 2023).iso() == "2023-01-15");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: amount formats... ";
        try {
            assert(approx(amount_of("$1,200.00"), 1200.0));
            assert(approx(amount_of("-45.99"), -45.99));
            assert(approx(amount_of("(45.99)"), -45.99));
            assert(approx(amount_of("1.234,56"), 1234.56));
            assert(approx(amount_of("12,50"), 12.5));
            assert(approx(amount_of("1,234"), 1234.0));
            assert(approx(amount_of("1.234.567"), 1234567.0));
            assert(approx(amount_of("-\xE2\x82\xAC" "5.00"), -5.0));
            assert(approx(amount_of("C$120.50"), 120.5));
            assert(approx(amount_of("100.00 DR"), -100.0));
            assert(approx(amount_of("100.00 CR"), 100.0));
            assert(approx(amount_of("50.00-"), -50.0));
            assert(approx(amount_of("1 234,56"), 1234.56));

            double v = 0.0;
            assert(!parse_amount("", v));
            assert(!parse_amount("n/a", v));
            assert(!parse_amount("1,23,4", v));
            assert(!parse_amount("2000000000", v));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: header variants map to the same fields... ";
        try {
            const std::string body =
                "2024-01-03,Starbucks,-5.75\n"
                "2024-01-04,Payroll,2500.00\n";
            const std::vector<std::string> headers = {
                "date,description,amount\n",
                "Transaction Date,Merchant,Amount\n",
                "posted_date,payee,amount\n",
                " DATE , Payee , AMOUNT \n",
                "Posted-Date,Description,Transaction Amount\n",
            };

            CsvNormalizer normalizer;
            ParseResult reference = normalizer.parse(bytes(headers[0] + body));
            assert(reference.status.ok());
            assert(reference.transactions.size() == 2);

            for (const auto& h : headers) {
                ParseResult r = normalizer.parse(bytes(h + body));
                assert(r.status.ok());
                assert(r.transactions.size() == reference.transactions.size());
                for (size_t i = 0; i < r.transactions.size(); ++i) {
                    assert(r.transactions[i].date == reference.transactions[i].date);
                    assert(r.transactions[i].description == reference.transactions[i].description);
                    assert(approx(r.transactions[i].amount, reference.transactions[i].amount));
                }
            }

            assert(CsvNormalizer::canonical_column("Transaction Date") == "date");
            assert(CsvNormalizer::canonical_column("  PAYEE ") == "description");
            assert(CsvNormalizer::canonical_column("Debit") == "debit");
            assert(CsvNormalizer::canonical_column("Balance").empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: MM/DD/YYYY with separate debit and credit columns... ";
        try {
            const std::string csv =
                "Posted Date,Payee,Debit,Credit\n"
                "01/15/2024,STARBUCKS #123,5.75,\n"
                "01/16/2024,PAYROLL ACME,,2500.00\n";

            ParseResult r = CsvNormalizer().parse(bytes(csv));
            assert(r.status.ok());
            assert(r.transactions.size() == 2);

            const auto& coffee = r.transactions[0];
            assert(coffee.date.iso() == "2024-01-15");
            assert(coffee.description == "STARBUCKS #123");
            assert(approx(coffee.amount, -5.75));
            assert(coffee.type == TransactionType::DEBIT);

            const auto& pay = r.transactions[1];
            assert(pay.date.iso() == "2024-01-16");
            assert(approx(pay.amount, 2500.0));
            assert(pay.type == TransactionType::CREDIT);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: missing columns are all named... ";
        try {
            ParseResult one = CsvNormalizer().parse(bytes("Date,Memo\n2024-01-01,Coffee\n"));
            assert(one.status.kind == ErrorKind::MISSING_COLUMNS);
            assert(one.status.message.find("amount") != std::string::npos);
            assert(one.status.message.find("date") == std::string::npos);

            ParseResult all = CsvNormalizer().parse(bytes("Foo,Bar\n1,2\n"));
            assert(all.status.kind == ErrorKind::MISSING_COLUMNS);
            assert(all.status.message.find("date") != std::string::npos);
            assert(all.status.message.find("description") != std::string::npos);
            assert(all.status.message.find("amount") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: bad rows are dropped and counted... ";
        try {
            const std::string csv =
                "date,description,amount\n"
                "2024-01-01,Good row,-10.00\n"
                "not a date,Bad date,-1.00\n"
                "2024-01-02,Bad amount,abc\n"
                "2024-01-03,Zero amount,0.00\n"
                "2024-01-04,,-3.00\n"
                "2024-01-05,Another good row,20\n";

            ParseResult r = CsvNormalizer().parse(bytes(csv));
            assert(r.status.ok());
            assert(r.transactions.size() == 2);
            assert(r.stats.rows_total == 6);
            assert(r.stats.dropped_bad_date == 1);
            assert(r.stats.dropped_bad_amount == 1);
            assert(r.stats.dropped_zero_amount == 1);
            assert(r.stats.dropped_empty_description == 1);
            assert(r.stats.rows_dropped() == 4);
            assert(r.transactions[0].source_row == 1);
            assert(r.transactions[1].source_row == 6);

            ParseResult none = CsvNormalizer().parse(bytes("date,description,amount\nx,y,z\n"));
            assert(none.status.kind == ErrorKind::NO_TRANSACTIONS_FOUND);
            assert(none.status.message.find("bad_date=1") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 9: row limit rejects before mapping... ";
        try {
            std::string csv = "date,description,amount\n";
            for (int i = 0; i < 6; ++i) csv += "2024-01-01,Row,-1.00\n";

            ParseResult over = CsvNormalizer(5).parse(bytes(csv));
            assert(over.status.kind == ErrorKind::ROW_LIMIT_EXCEEDED);
            assert(over.transactions.empty());

            ParseResult at_limit = CsvNormalizer(6).parse(bytes(csv));
            assert(at_limit.status.ok());
            assert(at_limit.transactions.size() == 6);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 10: quoting, delimiters, type column, hints... ";
        try {
            const std::string quoted =
                "Date,Description,Amount,Currency,Category\r\n"
                "2024-01-03,\"ACME, INC \"\"WEST\"\"\",\"-1,250.00\",cad,Shopping\r\n"
                "2024-01-04,\"Multi\nline\",-2.00,,\r\n";
            ParseResult q = CsvNormalizer().parse(bytes(quoted));
            assert(q.status.ok());
            assert(q.transactions.size() == 2);
            assert(q.transactions[0].description == "ACME, INC \"WEST\"");
            assert(approx(q.transactions[0].amount, -1250.0));
            assert(q.transactions[0].currency_hint == "cad");
            assert(q.transactions[0].category_hint == "Shopping");
            assert(q.transactions[1].description == "Multi\nline");

            ParseResult semi = CsvNormalizer().parse(bytes(
                "date;description;amount\n15.01.2024;Cafe;-4,50\n"));
            assert(semi.status.ok());
            assert(semi.stats.delimiter == ';');
            assert(approx(semi.transactions[0].amount, -4.5));

            ParseResult typed = CsvNormalizer().parse(bytes(
                "date,description,amount,type\n"
                "2024-01-01,Rent,1200,debit\n"
                "2024-01-02,Refund,15.00,credit\n"));
            assert(typed.status.ok());
            assert(approx(typed.transactions[0].amount, -1200.0));
            assert(approx(typed.transactions[1].amount, 15.0));

            ParseResult latin = CsvNormalizer().parse(bytes(
                "date,description,amount\n2024-01-01,Caf\xE9 Paris,-4.50\n"));
            assert(latin.status.ok());
            assert(latin.stats.encoding == "latin-1");
            assert(latin.transactions[0].description == "Caf\xC3\xA9 Paris");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";
    return failed == 0 ? 0 : 1;
}
