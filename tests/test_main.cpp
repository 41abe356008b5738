#include <gtest/gtest.h>
#include <QCoreApplication>

// One QCoreApplication for the whole suite: queued dispatch and provider
// completions need an event loop on the test thread.
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    qputenv("QT_LOGGING_RULES", "tabula.*.debug=false");
    QCoreApplication app(argc, argv);

    return RUN_ALL_TESTS();
}
