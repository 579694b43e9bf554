#include "app/Application.hpp"

#include <QMessageBox>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        nettune::app::Application app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        // Only show message box if QApplication exists
        if (QCoreApplication::instance()) {
            QMessageBox::critical(nullptr, "NetTune Error",
                                  QString("A fatal error occurred:\n%1").arg(e.what()));
        }
        return 1;
    }
}
