// Replays inputs through a fuzz target without libFuzzer
// Usage: fuzz_irc_message <input-file>...

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char **argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input-file>...\n", argv[0]);
        fprintf(stderr, "Build with clang to get a real libFuzzer binary.\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary);
        if (!file) {
            fprintf(stderr, "Error: cannot open '%s'\n", argv[i]);
            return 1;
        }
        std::vector<uint8_t> input((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
        LLVMFuzzerTestOneInput(input.data(), input.size());
        printf("%s: %zu bytes ok\n", argv[i], input.size());
    }
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
