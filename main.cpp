#include "app/DiscArchiverApp.hpp"

int main(int argc, char** argv) {
    discarchiver::app::DiscArchiverApp app;
    return app.Run(argc, argv);
}
