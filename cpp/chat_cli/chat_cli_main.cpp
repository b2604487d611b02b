#include "chat_cli_service.hpp"

int main(int argc, char** argv) {
    chat_cli::ChatCliService service;

    if (!service.initialize(argc, argv)) {
        return 1;
    }

    service.start();
    return 0;
}
