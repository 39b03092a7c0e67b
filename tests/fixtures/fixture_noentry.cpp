// Shared object that is not a module: it has no entry point

extern "C" __attribute__((visibility("default"))) int mudhost_fixture_answer() {
    return 42;
}
