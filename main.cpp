#include "app/OrionApp.hpp"

int main(int argc, char** argv) {
    orion::app::OrionApp app;
    return app.Run(argc, argv);
}
