// A transform module used by the test suite: reverses the order of the bytes.

#include <dply/transform/module_abi.h>

#include <algorithm>
#include <cstring>
#include <string>

namespace {

int reverse(const dply_transform_args* args) {
    if (args->size == 0) {
        std::strncpy(args->error_buf, "Refusing to reverse empty input", args->error_buf_size - 1);
        return 1;
    }
    std::string buf(args->data, args->size);
    std::reverse(buf.begin(), buf.end());
    args->emit(args->sink, buf.data(), buf.size());
    return 0;
}

}  // namespace

DPLY_MODULE_API int dply_transform_data(const dply_transform_args* args) { return reverse(args); }
DPLY_MODULE_API int dply_restore_data(const dply_transform_args* args) { return reverse(args); }
