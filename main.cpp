/**
 * @file main.cpp
 * @brief Entry point for the finfacts command line tool.
 */
#include "app/FinFactsApp.hpp"

int main(int argc, char** argv) {
    finfacts::app::FinFactsApp app;
    return app.Run(argc, argv);
}
