#include "Game/Viewer.h"

int main(int argc, char* argv[]) noexcept {
    // An optional level file can be given on the command line to override the one in the config
    const char* const levelFile = (argc > 1) ? argv[1] : nullptr;
    return Viewer::run(levelFile);
}
