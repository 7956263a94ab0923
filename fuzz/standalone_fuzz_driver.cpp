// Standalone driver that replays one input file through a fuzz target
// Used when the compiler has no libFuzzer runtime (NEARLINK_FUZZ_STANDALONE)

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file>\n", argv[0]);
        fprintf(stderr, "Replays a single corpus file. Build with clang and\n");
        fprintf(stderr, "-DNEARLINK_FUZZ_STANDALONE=OFF for coverage-guided fuzzing.\n");
        return 1;
    }

    // Read input file
    std::ifstream file(argv[1], std::ios::binary | std::ios::ate);
    if (!file) {
        fprintf(stderr, "Error: Cannot open file '%s'\n", argv[1]);
        return 1;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    if (size < 0) {
        fprintf(stderr, "Error: Cannot size file '%s'\n", argv[1]);
        return 1;
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        fprintf(stderr, "Error: Cannot read file '%s'\n", argv[1]);
        return 1;
    }

    int result = LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    printf("%s: %zd bytes, target returned %d\n", argv[1], size, result);
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
