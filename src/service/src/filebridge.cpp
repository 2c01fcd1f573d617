/*!
  \file filebridge.cpp
  \brief Точка входа службы filebridge.
*/

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
    ServiceController controller;
    return controller.run(argc, argv);
}
