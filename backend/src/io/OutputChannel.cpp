// backend/src/io/OutputChannel.cpp
#include <quill/backend/io/OutputChannel.hpp>


namespace quill::backend::io {

    void StreamOutputChannel::emit(std::string_view value) {
        os_ << value << '\n';
        os_.flush();
    }

} // namespace quill::backend::io
