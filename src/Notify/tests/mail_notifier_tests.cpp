#include "../MailNotifier.h"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/unit_test.hpp>

struct MailNotifierFixture {
    MailNotifier notifier = MailNotifier({
            .smtpServer = "127.0.0.1:1",
            .sender = "sds@example.org",
            .contactEmail = "rds@example.org"
    });
};

BOOST_FIXTURE_TEST_SUITE(mail_notifier_test_suite, MailNotifierFixture)
    BOOST_AUTO_TEST_CASE(test_completed_message) {
        auto message = notifier.completedMessage("u@x.com", "https://dl.example.org/sds/a.zip");

        BOOST_CHECK_EQUAL(message.to, "u@x.com");
        BOOST_CHECK_EQUAL(message.subject, "Your requested archive is ready to download");
        BOOST_CHECK(boost::algorithm::contains(message.body, "\nhttps://dl.example.org/sds/a.zip\n"));
        BOOST_CHECK(boost::algorithm::contains(message.body, "valid only for 24 hours"));
        BOOST_CHECK(boost::algorithm::contains(message.body, "rds@example.org"));
    }

    BOOST_AUTO_TEST_CASE(test_failed_message) {
        auto message = notifier.failedMessage("u@x.com", "a.zip");

        BOOST_CHECK_EQUAL(message.subject, "Failed on retrieving your requested archive");
        BOOST_CHECK(boost::algorithm::contains(message.body, "\n\na.zip\n\n"));
        BOOST_CHECK(boost::algorithm::contains(message.body, "rds@example.org"));
    }

    BOOST_AUTO_TEST_CASE(test_cancelled_message) {
        auto message = notifier.cancelledMessage("u@x.com", "a.zip");

        BOOST_CHECK_EQUAL(message.subject, "Cancelled your request for archive");
        BOOST_CHECK(boost::algorithm::contains(message.body, "maximum number of requests"));
        BOOST_CHECK(boost::algorithm::contains(message.body, "resubmit your request for a.zip"));
    }

    BOOST_AUTO_TEST_CASE(test_render_headers_and_line_endings) {
        sMailMessage message{.to = "u@x.com", .subject = "Hello", .body = "line one\nline two\r\n"};

        BOOST_CHECK_EQUAL(
                message.render("sds@example.org"),
                "From: sds@example.org\r\nTo: u@x.com\r\nSubject: Hello\r\n\r\nline one\r\nline two\r\n"
        );
    }

    BOOST_AUTO_TEST_CASE(test_render_refuses_header_injection) {
        sMailMessage message{.to = "u@x.com\r\nBcc: victim@x.com", .subject = "Hello", .body = "body"};
        BOOST_CHECK_THROW(message.render("sds@example.org"), eNotificationError);

        message = {.to = "u@x.com", .subject = "Hello\nBcc: victim@x.com", .body = "body"};
        BOOST_CHECK_THROW(message.render("sds@example.org"), eNotificationError);

        // Line breaks in the body are fine
        message = {.to = "u@x.com", .subject = "Hello", .body = "one\nBcc: not a header"};
        BOOST_CHECK_NO_THROW(message.render("sds@example.org"));
    }

    BOOST_AUTO_TEST_CASE(test_unreachable_relay_raises) {
        BOOST_CHECK_THROW(notifier.notifyFailed("u@x.com", "a.zip"), eNotificationError);
    }
BOOST_AUTO_TEST_SUITE_END()
