#pragma once

#include <QApplication>

namespace nettune::test {

/**
 * Creates the offscreen QApplication widget tests need, once per process.
 */
inline bool ensureQApplication() {
    static int argc = 1;
    static char* argv[] = {const_cast<char*>("nettune_widget_tests")};
    static QApplication* app = nullptr;
    if (!QApplication::instance()) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
        app = new QApplication(argc, argv);
    }
    return app != nullptr || QApplication::instance() != nullptr;
}

} // namespace nettune::test
