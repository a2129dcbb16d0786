// Every test in this directory is a set of static_asserts; building the
// executable is the test.
int main() {
    return 0;
}
