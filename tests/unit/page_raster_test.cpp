#include "internal/raster/page_raster.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using relaynorm::raster::LoadPageRaster;

fs::path Scratch() {
  const auto dir = fs::temp_directory_path() / "relaynorm_page_raster_test";
  fs::create_directories(dir);
  return dir;
}

bool ThrowsInvalidInput(const fs::path& path) {
  try {
    LoadPageRaster(path);
  } catch (const relaynorm::util::InvalidInput&) {
    return true;
  }
  return false;
}

void TestGrayPngComesBackAsBgr() {
  const auto path = Scratch() / "gray.png";
  cv::Mat    page(30, 40, CV_8UC1, cv::Scalar(255));
  cv::rectangle(page, cv::Rect(5, 5, 10, 10), cv::Scalar(0), cv::FILLED);
  assert(cv::imwrite(path.string(), page));

  const auto loaded = LoadPageRaster(path);
  assert(loaded.type() == CV_8UC3);
  assert(loaded.cols == 40 && loaded.rows == 30);
  assert(loaded.at<cv::Vec3b>(10, 10) == cv::Vec3b(0, 0, 0));
  assert(loaded.at<cv::Vec3b>(20, 30) == cv::Vec3b(255, 255, 255));
}

void TestColourPngKeepsChannels() {
  const auto path = Scratch() / "colour.png";
  cv::Mat    page(20, 20, CV_8UC3, cv::Scalar(255, 255, 255));
  page.at<cv::Vec3b>(3, 4) = cv::Vec3b(0, 0, 200);
  assert(cv::imwrite(path.string(), page));

  const auto loaded = LoadPageRaster(path);
  assert(loaded.type() == CV_8UC3);
  assert(loaded.at<cv::Vec3b>(3, 4) == cv::Vec3b(0, 0, 200));
}

void TestSixteenBitPngIsScaledDown() {
  const auto path = Scratch() / "deep.png";
  const cv::Mat page(10, 10, CV_16UC1, cv::Scalar(65535));
  assert(cv::imwrite(path.string(), page));

  const auto loaded = LoadPageRaster(path);
  assert(loaded.type() == CV_8UC3);
  assert(loaded.at<cv::Vec3b>(5, 5) == cv::Vec3b(255, 255, 255));
}

void TestJpegAndPgmPages() {
  cv::Mat page(32, 32, CV_8UC1, cv::Scalar(255));
  cv::rectangle(page, cv::Rect(0, 0, 16, 32), cv::Scalar(0), cv::FILLED);

  const auto jpeg = Scratch() / "page.jpg";
  assert(cv::imwrite(jpeg.string(), page));
  const auto from_jpeg = LoadPageRaster(jpeg);
  assert(from_jpeg.type() == CV_8UC3);
  // lossy: well inside each half
  assert(from_jpeg.at<cv::Vec3b>(16, 4)[0] < 40);
  assert(from_jpeg.at<cv::Vec3b>(16, 28)[0] > 215);

  const auto pgm = Scratch() / "page.pgm";
  assert(cv::imwrite(pgm.string(), page));
  const auto from_pgm = LoadPageRaster(pgm);
  assert(from_pgm.cols == 32 && from_pgm.rows == 32);
  assert(from_pgm.at<cv::Vec3b>(16, 4)[1] == 0);
}

void TestMissingAndUndecodableFiles() {
  assert(ThrowsInvalidInput(Scratch() / "absent.png"));
  assert(ThrowsInvalidInput(Scratch()));

  const auto garbage = Scratch() / "garbage.png";
  {
    std::ofstream out(garbage, std::ios::binary | std::ios::trunc);
    out << "not an image";
  }
  assert(ThrowsInvalidInput(garbage));
}

} // namespace

int main() {
  TestGrayPngComesBackAsBgr();
  TestColourPngKeepsChannels();
  TestSixteenBitPngIsScaledDown();
  TestJpegAndPgmPages();
  TestMissingAndUndecodableFiles();

  fs::remove_all(Scratch());
  std::cout << "relaynorm_unit_page_raster: pass\n";
  return 0;
}
