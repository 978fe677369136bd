/**
 * @file MediaPipeHandTracker.cpp
 * @brief MediaPipe Hands landmark source using pybind11
 */

#include <fingerlaunch/gesture/MediaPipeHandTracker.hpp>
#include <fingerlaunch/core/Logger.hpp>
#include <fingerlaunch/core/exception.h>

#include <opencv2/imgproc.hpp>

#include <pybind11/embed.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace pybind11::literals;

namespace fingerlaunch {
namespace gesture {

/**
 * @brief PIMPL implementation holding all Python objects
 */
class MediaPipeHandTracker::Impl {
public:
    /**
     * @brief Process-wide interpreter guard
     *
     * Only one interpreter may exist per process; it is torn down at exit.
     */
    static py::scoped_interpreter& getPythonInterpreter() {
        static py::scoped_interpreter guard{};
        return guard;
    }

    explicit Impl(const HandTrackerConfig& config)
        : processed_frames_(0)
    {
        LOG_INFO("MediaPipeHandTracker: Initializing...");

        try {
            getPythonInterpreter();

            py::module_ sys = py::module_::import("sys");
            LOG_DEBUG("MediaPipeHandTracker: Python " + sys.attr("version").cast<std::string>());

            py::module_ mp = py::module_::import("mediapipe");
            py::object hands_module = mp.attr("solutions").attr("hands");
            hands_ = hands_module.attr("Hands")(
                "static_image_mode"_a = false,
                "max_num_hands"_a = config.max_num_hands,
                "min_detection_confidence"_a = config.min_detection_confidence,
                "min_tracking_confidence"_a = config.min_tracking_confidence);
        } catch (const py::error_already_set& e) {
            FINGERLAUNCH_THROW(core::HandTrackerException,
                               std::string("Failed to initialize MediaPipe Hands: ") + e.what());
        }

        LOG_INFO("MediaPipeHandTracker: Ready (max_num_hands=" +
                 std::to_string(config.max_num_hands) + ")");
    }

    ~Impl() {
        if (hands_.is_none()) {
            return;
        }
        try {
            hands_.attr("close")();
        } catch (const py::error_already_set& e) {
            LOG_WARNING(std::string("MediaPipeHandTracker: close() failed: ") + e.what());
        }
    }

    bool detect(const cv::Mat& frame, std::optional<HandObservation>& observation) {
        observation.reset();

        if (frame.empty()) {
            last_error_ = "Empty input frame";
            return false;
        }
        if (frame.type() != CV_8UC3) {
            last_error_ = "Frame must be 8-bit BGR";
            return false;
        }

        cv::Mat rgb;
        cv::cvtColor(frame, rgb, cv::COLOR_BGR2RGB);

        try {
            // No base handle: pybind11 copies the buffer into the array
            py::array_t<uint8_t> np_frame({rgb.rows, rgb.cols, 3}, rgb.data);

            py::object results = hands_.attr("process")(np_frame);
            ++processed_frames_;

            py::object multi_landmarks = results.attr("multi_hand_landmarks");
            if (multi_landmarks.is_none() || py::len(multi_landmarks) == 0) {
                return true;
            }

            HandObservation hand;
            py::object first = multi_landmarks.attr("__getitem__")(0);
            for (auto lm : first.attr("landmark")) {
                hand.landmarks.emplace_back(lm.attr("x").cast<float>(),
                                            lm.attr("y").cast<float>(),
                                            lm.attr("z").cast<float>());
            }

            py::object multi_handedness = results.attr("multi_handedness");
            if (!multi_handedness.is_none() && py::len(multi_handedness) > 0) {
                py::object classification =
                    multi_handedness.attr("__getitem__")(0).attr("classification").attr("__getitem__")(0);
                hand.handedness = handedness_from_string(classification.attr("label").cast<std::string>());
                hand.confidence = classification.attr("score").cast<float>();
            }

            observation = std::move(hand);
            return true;

        } catch (const py::error_already_set& e) {
            last_error_ = std::string("Python error in process(): ") + e.what();
            LOG_ERROR("MediaPipeHandTracker: " + last_error_);
            return false;
        } catch (const py::cast_error& e) {
            last_error_ = std::string("Unexpected MediaPipe result: ") + e.what();
            LOG_ERROR("MediaPipeHandTracker: " + last_error_);
            return false;
        }
    }

    uint64_t getProcessedFrames() const {
        return processed_frames_;
    }

    std::string getLastError() const {
        return last_error_;
    }

private:
    py::object hands_ = py::none();   ///< mediapipe.solutions.hands.Hands instance
    uint64_t processed_frames_;
    std::string last_error_;
};

MediaPipeHandTracker::MediaPipeHandTracker(const HandTrackerConfig& config)
    : pImpl(std::make_unique<Impl>(config))
{
}

MediaPipeHandTracker::~MediaPipeHandTracker() = default;

bool MediaPipeHandTracker::detect(const cv::Mat& frame, std::optional<HandObservation>& observation) {
    return pImpl->detect(frame, observation);
}

uint64_t MediaPipeHandTracker::getProcessedFrames() const {
    return pImpl->getProcessedFrames();
}

std::string MediaPipeHandTracker::getLastError() const {
    return pImpl->getLastError();
}

} // namespace gesture
} // namespace fingerlaunch
