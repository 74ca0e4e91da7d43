// backend/include/quill/backend/io/OutputChannel.hpp
#pragma once
#include <ostream>
#include <string>
#include <string_view>
#include <vector>


namespace quill::backend::io {

    /// @brief Print 결과를 받는 출력 채널.
    /// @details 실행기는 값을 만들자마자 emit을 호출한다. 호출 순서 == 관측 순서.
    class OutputChannel {
    public:
        virtual ~OutputChannel() = default;

        virtual void emit(std::string_view value) = 0;
    };

    /// @brief 값마다 한 줄씩 스트림에 쓰고 즉시 flush한다.
    class StreamOutputChannel final : public OutputChannel {
    public:
        explicit StreamOutputChannel(std::ostream& os) : os_(os) {}

        void emit(std::string_view value) override;

    private:
        std::ostream& os_;
    };

    /// @brief 값을 메모리에 모은다 (테스트/비교용).
    class BufferOutputChannel final : public OutputChannel {
    public:
        void emit(std::string_view value) override {  values_.emplace_back(value);  }

        const std::vector<std::string>& values() const {  return values_;  }
        void clear() {  values_.clear();  }

    private:
        std::vector<std::string> values_;
    };

} // namespace quill::backend::io
