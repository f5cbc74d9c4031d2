#include "options.hpp"
#include "pipeline.hpp"

int main(int argc, char **argv) {
    auto opts = Options{};
    if (!parse_options(argc, argv, opts)) {
        return 1;
    }

    return run(opts);
}
