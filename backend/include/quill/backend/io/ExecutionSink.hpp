// backend/include/quill/backend/io/ExecutionSink.hpp
#pragma once
#include <quill/diag/Errors.hpp>
#include <quill/qir/QIR.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>


namespace quill::backend::io {

    /// @brief 영속화 결과. 실패 원인은 항상 PersistenceError로만 보고한다.
    struct PersistResult {
        bool ok = false;
        std::optional<PersistenceError> error{};
    };

    /// @brief 완성된 출력 프로그램을 받아 보관하는 sink.
    /// @details 한 번의 persist 호출은 전부 쓰이거나 전혀 쓰이지 않아야 한다.
    class ExecutionSink {
    public:
        virtual ~ExecutionSink() = default;

        /// @brief 산출물 바이트열을 한 번에 기록한다 (QIR 텍스트, LLVM-IR, object).
        virtual PersistResult persist_bytes(std::string_view bytes) = 0;

        /// @brief 모듈을 QIR 텍스트로 직렬화해 기록한다.
        PersistResult persist(const qir::Module& m);

        /// @brief 사람이 읽을 수 있는 대상 이름 (메시지용).
        virtual std::string describe_target() const = 0;
    };

    /// @brief 임시 파일에 쓴 뒤 rename으로 교체하는 원자적 파일 sink.
    class FileSink final : public ExecutionSink {
    public:
        explicit FileSink(std::filesystem::path path) : path_(std::move(path)) {}

        PersistResult persist_bytes(std::string_view bytes) override;
        std::string describe_target() const override {  return path_.string();  }

        const std::filesystem::path& path() const {  return path_;  }

    private:
        std::filesystem::path path_;
    };

    /// @brief 메모리 sink. persist 횟수와 마지막 내용을 보관한다.
    class BufferSink final : public ExecutionSink {
    public:
        PersistResult persist_bytes(std::string_view bytes) override {
            bytes_.assign(bytes.data(), bytes.size());
            ++persist_count_;
            return PersistResult{true, std::nullopt};
        }

        std::string describe_target() const override {  return "<memory>";  }

        const std::string& bytes() const {  return bytes_;  }
        uint32_t persist_count() const   {  return persist_count_;  }

    private:
        std::string bytes_{};
        uint32_t persist_count_ = 0;
    };

} // namespace quill::backend::io
