/**
 * @file main.cpp
 * @brief Entry point for binlogsync
 */

#include <iostream>

#include "app/application.h"

int main(int argc, char* argv[]) {
  auto app = binlogsync::app::Application::Create(argc, argv);
  if (!app) {
    std::cerr << "Failed to start binlogsync: " << app.error().to_string() << "\n";
    return 1;
  }
  return (*app)->Run();
}
