// Standalone fuzz driver for running fuzz targets when libFuzzer is not available
// Replays each file named on the command line (for example a corpus written
// by shapefuzz-gen) through the target once.

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char **argv) {
  if (argc < 2) {
    fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
    fprintf(stderr, "\nNote: This is a standalone driver for replaying inputs.\n");
    fprintf(stderr, "For actual fuzzing, rebuild with -DENABLE_FUZZING=ON using clang.\n");
    return 1;
  }

  for (int i = 1; i < argc; ++i) {
    std::ifstream file(argv[i], std::ios::binary | std::ios::ate);
    if (!file) {
      fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
      return 1;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char *>(buffer.data()), size)) {
      fprintf(stderr, "Error: Cannot read file '%s'\n", argv[i]);
      return 1;
    }

    int result = LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    printf("%s: %zd bytes, returned %d\n", argv[i], size, result);
  }
  return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
