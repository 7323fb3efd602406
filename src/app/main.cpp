#include "include/application.hpp"

int main(int argc, char* argv[]) {
    speedwatch::Application app;
    return app.run(argc, argv);
}
