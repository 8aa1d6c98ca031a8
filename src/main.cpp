#include <QCoreApplication>
#include <QCommandLineParser>
#include <QColor>
#include <QTextStream>
#include <memory>
#include "configmanager.h"
#include "diffengine.h"
#include "diffworker.h"
#include "errorhandler.h"
#include "imageiohelper.h"
#include "normalizer.h"
#include "performancemonitor.h"
#include "platformdetector.h"
#include "rendercache.h"

namespace {

bool applyOptions(const QCommandLineParser& parser, AppConfig& config, QString& error)
{
    bool ok = true;

    if (parser.isSet("mode")) {
        config.diffOptions.mode = diffModeFromString(parser.value("mode").toStdString(), &ok);
        if (!ok) {
            error = "Unknown mode: " + parser.value("mode");
            return false;
        }
    }
    if (parser.isSet("threshold")) {
        config.diffOptions.threshold = parser.value("threshold").toDouble(&ok);
        if (!ok) {
            error = "Invalid threshold: " + parser.value("threshold");
            return false;
        }
    }
    if (parser.isSet("opacity")) {
        config.diffOptions.overlayOpacity = parser.value("opacity").toDouble(&ok);
        if (!ok) {
            error = "Invalid opacity: " + parser.value("opacity");
            return false;
        }
    }
    if (parser.isSet("grayscale")) {
        config.diffOptions.useGrayscale = true;
    }

    if (parser.isSet("normalize")) {
        config.normalization.type = CanvasNormalizer::typeFromString(parser.value("normalize"), &ok);
        if (!ok) {
            error = "Unknown normalization: " + parser.value("normalize");
            return false;
        }
    }
    if (parser.isSet("align")) {
        config.normalization.alignment = CanvasNormalizer::alignmentFromString(parser.value("align"), &ok);
        if (!ok) {
            error = "Unknown alignment: " + parser.value("align");
            return false;
        }
    }
    if (parser.isSet("background")) {
        QColor color(parser.value("background"));
        if (!color.isValid()) {
            error = "Invalid background color: " + parser.value("background");
            return false;
        }
        config.normalization.backgroundColor = color;
    }
    if (parser.isSet("scale-to-fit")) {
        config.normalization.scaleToFit = true;
    }
    if (parser.isSet("async")) {
        config.useBackgroundWorker = true;
    }

    if (!config.diffOptions.isValid()) {
        error = "Threshold must be within 0-255 and opacity within 0-1";
        return false;
    }
    return true;
}

DiffResult runInWorker(CanvasPool& pool, const Canvas& image1, const Canvas& image2,
                       const AppConfig& config, Canvas& output, Canvas* original)
{
    CanvasNormalizer normalizer(pool);
    NormalizedCanvases normalized = normalizer.normalizeCanvases(image1, image2, config.normalization);
    const int width = normalized.dimensions.targetWidth;
    const int height = normalized.dimensions.targetHeight;

    DiffWorker worker;
    std::future<WorkerResponse> future = worker.compareAsync(*normalized.canvas1, *normalized.canvas2,
                                                             config.diffOptions);
    WorkerResponse response = future.get();
    worker.terminateWorker();

    DiffWorker::applyToCanvas(response, width, height, output);
    if (original) {
        original->resize(width, height);
        original->putImageData(response.originalData);
    }
    return response.toDiffResult();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("PageDiff");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("PageDiff");

    QCommandLineParser parser;
    parser.setApplicationDescription("Compare two page images and render their differences");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("image1", "First image");
    parser.addPositionalArgument("image2", "Second image");
    parser.addOptions({
        {{"m", "mode"}, "Comparison mode: pixel, threshold, grayscale, overlay, heatmap, semantic, webgl.", "mode"},
        {{"t", "threshold"}, "Difference tolerance, 0-255.", "value"},
        {"opacity", "Overlay highlight opacity, 0-1.", "value"},
        {"grayscale", "Compare luminance on the GPU path."},
        {"normalize", "Target size: largest, smallest, first, second.", "type"},
        {"align", "Placement: top-left, center, top-center.", "alignment"},
        {"background", "Padding color, e.g. #ffffff.", "color"},
        {"scale-to-fit", "Scale both images to fit the target."},
        {"async", "Run the comparison on the background worker."},
        {{"o", "output"}, "Write the diff image to <file>.", "file"},
        {"original", "Write the image without highlighting to <file>.", "file"},
        {"config", "Read settings from an INI <file>.", "file"},
        {"report", "Print the performance report."},
        {"verbose", "Log debug messages."}
    });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 2) {
        err << "Expected two image paths" << Qt::endl;
        parser.showHelp(1);
    }

    std::unique_ptr<ConfigManager> configManager = parser.isSet("config")
        ? std::make_unique<ConfigManager>(parser.value("config"))
        : std::make_unique<ConfigManager>();
    AppConfig config = configManager->loadConfig();
    if (parser.isSet("verbose")) {
        config.minLogLevel = LogLevel::Debug;
    }
    ConfigManager::applyLoggingConfig(config);

    QString optionError;
    if (!applyOptions(parser, config, optionError)) {
        err << optionError << Qt::endl;
        return 1;
    }

    LOG_DEBUG("Main", PlatformDetector::getInstance().getCapabilitiesSummary());

    // Comparing a page with itself decodes it once
    RenderCache rasterCache(static_cast<size_t>(config.renderCacheSize));
    std::shared_ptr<const Canvas> page1 = ImageIOHelper::loadCanvasCached(args.at(0), rasterCache);
    if (!page1) {
        err << "Cannot read image: " << args.at(0) << Qt::endl;
        return 1;
    }
    std::shared_ptr<const Canvas> page2 = ImageIOHelper::loadCanvasCached(args.at(1), rasterCache);
    if (!page2) {
        err << "Cannot read image: " << args.at(1) << Qt::endl;
        return 1;
    }
    const Canvas& image1 = *page1;
    const Canvas& image2 = *page2;
    LOG_DEBUG("Main", "Raster cache hits: " + std::to_string(rasterCache.getStats().hits));

    CanvasPool pool(static_cast<size_t>(config.canvasPoolSize));
    Canvas output;
    Canvas original;
    const bool wantOriginal = parser.isSet("original");
    DiffResult result;
    bool usedGPU = false;

    try {
        if (config.useBackgroundWorker) {
            result = runInWorker(pool, image1, image2, config, output, wantOriginal ? &original : nullptr);
        } else {
            EngineConfig engineConfig;
            engineConfig.enableGPU = config.enableGPU;
            DiffEngine engine(pool, engineConfig);

            ComparisonDetails details;
            result = engine.comparePdfs(image1, image2, output, config.diffOptions,
                                        config.normalization, &details);
            usedGPU = details.usedGPU;
            if (wantOriginal && !details.originalData.empty()) {
                original = Canvas::fromMat(details.originalData);
            }
        }
    } catch (const std::exception& e) {
        AppError error = ErrorHandler::handleError(e, "compare");
        err << QString::fromStdString(error.userMessage) << Qt::endl;
        err << QString::fromStdString(error.technicalDetails) << Qt::endl;
        return 2;
    }

    out << "mode: " << QString::fromStdString(diffModeToString(config.diffOptions.mode))
        << (usedGPU ? " (gpu)" : "") << Qt::endl;
    out << "size: " << output.width() << "x" << output.height() << Qt::endl;
    out << "differenceCount: " << result.differenceCount << Qt::endl;
    out << "totalPixels: " << result.totalPixels << Qt::endl;
    out << "percentDiff: " << QString::number(result.percentDiff, 'f', 4) << Qt::endl;

    int exitCode = 0;
    if (parser.isSet("output") && !ImageIOHelper::saveCanvas(parser.value("output"), output)) {
        err << "Cannot write image: " << parser.value("output") << Qt::endl;
        exitCode = 1;
    }
    if (wantOriginal) {
        if (original.isEmpty()) {
            LOG_WARNING("Main", "No diff-free rendering available for a GPU comparison");
        } else if (!ImageIOHelper::saveCanvas(parser.value("original"), original)) {
            err << "Cannot write image: " << parser.value("original") << Qt::endl;
            exitCode = 1;
        }
    }

    if (parser.isSet("report")) {
        out << QString::fromStdString(PerformanceMonitor::getInstance().generatePerformanceReport()) << Qt::endl;
    }

    return exitCode;
}
