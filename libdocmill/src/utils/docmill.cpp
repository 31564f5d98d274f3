/**
 * @file docmill.cpp
 * @brief Implementation of the public DocMill API.
 */

#include "../../include/docmill.hpp"

#include "../../include/batch_executor.hpp"
#include "../../include/document_pipeline.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/log_sink.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace docmill {

namespace {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    DocMillObserver* observer_;
public:
    explicit BridgeLogSink(DocMillObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

// keeps the bridge sink installed for the duration of one call
class ScopedSink {
    ILogSink* sink_ = nullptr;
public:
    explicit ScopedSink(DocMillObserver* observer) {
        if (observer) {
            sink_ = Logger::add_sink(std::make_unique<BridgeLogSink>(observer));
        }
    }
    ~ScopedSink() {
        if (sink_) Logger::remove_sink(sink_);
    }
    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;
};

} // namespace

struct DocMill::Impl {
    PipelineOptions options;
    unsigned numThreads = std::thread::hardware_concurrency() / 2;

    DocMillObserver* observer = nullptr;

    std::shared_ptr<const ExtractorRegistry> registry;
    std::unique_ptr<DocumentPipeline> pipeline;
    bool registryDirty = true;
    bool pipelineDirty = true;

    std::mutex execMutex;
    std::atomic<BatchExecutor*> currentExecutor = nullptr;

    Impl() {
        if (numThreads == 0) numThreads = 1;
    }

    const DocumentPipeline& ensurePipeline() {
        if (registryDirty || !registry) {
            registry = std::make_shared<const ExtractorRegistry>(options.extraction);
            registryDirty = false;
            pipelineDirty = true;
        }
        if (pipelineDirty || !pipeline) {
            pipeline = std::make_unique<DocumentPipeline>(registry, options.chunking);
            pipelineDirty = false;
        }
        return *pipeline;
    }

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;
        DocMillObserver* obs = observer;

        bus.subscribe<FileProcessStartEvent>([obs](const FileProcessStartEvent& e) {
            obs->onFileStart(e.path);
        });

        bus.subscribe<FileProcessCompleteEvent>([obs](const FileProcessCompleteEvent& e) {
            obs->onFileFinish(e.path, e.char_count, e.chunk_count);
        });

        bus.subscribe<FileProcessErrorEvent>([obs](const FileProcessErrorEvent& e) {
            obs->onFileError(e.path, e.error_message);
        });

        bus.subscribe<FileProcessSkippedEvent>([obs](const FileProcessSkippedEvent& e) {
            obs->onFileError(e.path, "Skipped: " + e.reason);
        });
    }
};

DocMill::DocMill() : impl_(std::make_unique<Impl>()) {}

DocMill::~DocMill() {
    if (impl_) stop();
}

DocMill::DocMill(DocMill&&) noexcept = default;
DocMill& DocMill::operator=(DocMill&&) noexcept = default;

DocMill& DocMill::maxChunkSize(const std::size_t val) {
    impl_->options.chunking.max_chunk_size = val;
    impl_->pipelineDirty = true;
    return *this;
}

DocMill& DocMill::chunkOverlap(const std::size_t val) {
    impl_->options.chunking.chunk_overlap = val;
    impl_->pipelineDirty = true;
    return *this;
}

DocMill& DocMill::enableOcr(const bool val) {
    impl_->options.extraction.enable_ocr = val;
    impl_->registryDirty = true;
    return *this;
}

DocMill& DocMill::ocrLanguage(const std::string& lang) {
    impl_->options.extraction.ocr_language = lang;
    impl_->registryDirty = true;
    return *this;
}

DocMill& DocMill::ocrDataPath(const std::filesystem::path& dir) {
    impl_->options.extraction.ocr_data_path = dir;
    impl_->registryDirty = true;
    return *this;
}

DocMill& DocMill::threads(const unsigned val) {
    impl_->numThreads = val > 0 ? val : std::thread::hardware_concurrency() / 2;
    if (impl_->numThreads == 0) impl_->numThreads = 1;
    impl_->options.extraction.ocr_threads = impl_->numThreads;
    impl_->registryDirty = true;
    return *this;
}

void DocMill::setObserver(DocMillObserver* observer) {
    impl_->observer = observer;
}

std::vector<ProcessingResult> DocMill::process(const std::vector<std::filesystem::path>& paths,
                                               const DocumentType type) {
    std::lock_guard lock(impl_->execMutex);
    ScopedSink bridge(impl_->observer);

    const DocumentPipeline& pipeline = impl_->ensurePipeline();

    EventBus eventBus;
    impl_->setupEventBridging(eventBus);

    BatchExecutor executor(pipeline, eventBus, impl_->numThreads);
    impl_->currentExecutor.store(&executor);
    struct ExecutorReset {
        std::atomic<BatchExecutor*>& slot;
        ~ExecutorReset() { slot.store(nullptr); }
    } reset{impl_->currentExecutor};

    return executor.process(paths, type);
}

ProcessingResult DocMill::process(const std::filesystem::path& path, const DocumentType type) {
    auto results = process(std::vector<std::filesystem::path>{path}, type);
    return std::move(results.front());
}

std::vector<FormatCapability> DocMill::supportedFormats() {
    std::lock_guard lock(impl_->execMutex);
    return impl_->ensurePipeline().registry().supported_formats();
}

void DocMill::stop() {
    auto* exec = impl_->currentExecutor.load();
    if (exec) {
        exec->request_stop();
    }
}

} // namespace docmill
