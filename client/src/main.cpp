#include "application.hpp"

int main(int argc, char** argv) {
    application app;
    return app.run(argc, argv);
}
