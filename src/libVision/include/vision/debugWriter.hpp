#pragma once

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <mutex>
#include <string>

namespace sudoku::vision {

//! Receives intermediate pipeline buffers for inspection. Only consulted in debug mode.
class IDebugWriter {
public:
	virtual ~IDebugWriter() = default;

	//! Persist an intermediate image. Must not throw; failures are logged and ignored.
	virtual void save(const std::string& name, const cv::Mat& image) = 0;
};

//! Writes every artifact as "<index>_<name>.png" into one directory.
class DebugDirectoryWriter : public IDebugWriter {
public:
	explicit DebugDirectoryWriter(std::filesystem::path directory);

	void save(const std::string& name, const cv::Mat& image) override;

	const std::filesystem::path& directory() const;
	unsigned written() const; //!< Number of artifacts successfully written.

private:
	std::filesystem::path m_directory;
	unsigned m_index{0};
	unsigned m_written{0};
	mutable std::mutex m_mutex;
};

} // namespace sudoku::vision
