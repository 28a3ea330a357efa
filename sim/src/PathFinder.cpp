// A* over maze passages. Binary min-heap open list, Manhattan heuristic.
// Neighbors are expanded in N, S, E, W order so results are reproducible.

#include "PathFinder.hpp"
#include <algorithm>
#include <cstdlib>
#include <deque>

// ── Internal types ──────────────────────────────────────────────────────────

namespace {

enum class NodeStatus : uint8_t { Undefined = 0, Open = 1, Closed = 2 };

struct Node {
  int costUntilNow = 0;   // g: cost from start to here
  int predictedTotal = 0; // f: g + h
  int parentIdx = -1;     // index into node pool (self = start sentinel)
  NodeStatus status = NodeStatus::Undefined;
};

// ── Binary min-heap for open list ───────────────────────────────────────────

struct MinHeap {
  std::vector<int> heap; // indices into node pool

  bool empty() const { return heap.empty(); }

  void push(int nodeIdx, const std::vector<Node> &nodes) {
    heap.push_back(nodeIdx);
    siftUp((int)heap.size() - 1, nodes);
  }

  int pop(const std::vector<Node> &nodes) {
    int top = heap[0];
    heap[0] = heap.back();
    heap.pop_back();
    if (!heap.empty())
      siftDown(0, nodes);
    return top;
  }

private:
  void siftUp(int i, const std::vector<Node> &nodes) {
    while (i > 0) {
      int parent = (i - 1) / 2;
      if (nodes[heap[i]].predictedTotal < nodes[heap[parent]].predictedTotal) {
        std::swap(heap[i], heap[parent]);
        i = parent;
      } else
        break;
    }
  }

  void siftDown(int i, const std::vector<Node> &nodes) {
    int n = (int)heap.size();
    while (true) {
      int smallest = i;
      int left = 2 * i + 1;
      int right = 2 * i + 2;
      if (left < n &&
          nodes[heap[left]].predictedTotal <
              nodes[heap[smallest]].predictedTotal)
        smallest = left;
      if (right < n &&
          nodes[heap[right]].predictedTotal <
              nodes[heap[smallest]].predictedTotal)
        smallest = right;
      if (smallest != i) {
        std::swap(heap[i], heap[smallest]);
        i = smallest;
      } else
        break;
    }
  }
};

} // namespace

int PathFinder::ManhattanDist(GridPoint a, GridPoint b) {
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// ── A* implementation ───────────────────────────────────────────────────────

std::vector<GridPoint> PathFinder::FindPath(const Maze &maze, GridPoint start,
                                            GridPoint end,
                                            int searchLimit) const {
  if (maze.Empty() || !maze.InBounds(start) || !maze.InBounds(end))
    return {};

  // Trivial: already at destination
  if (start == end)
    return {};

  std::vector<Node> nodes(maze.CellCount());

  int startIdx = maze.IndexOf(start);
  nodes[startIdx].costUntilNow = 0;
  nodes[startIdx].predictedTotal = ManhattanDist(start, end);
  nodes[startIdx].parentIdx = startIdx; // self-parent = start sentinel
  nodes[startIdx].status = NodeStatus::Open;

  MinHeap openList;
  openList.push(startIdx, nodes);

  const int endIdx = maze.IndexOf(end);
  int closedCount = 0;
  bool pathFound = false;

  while (!openList.empty()) {
    int curIdx = openList.pop(nodes);
    Node &cur = nodes[curIdx];

    // Skip already-closed (duplicate in heap)
    if (cur.status == NodeStatus::Closed)
      continue;

    if (curIdx == endIdx) {
      cur.status = NodeStatus::Closed;
      pathFound = true;
      break;
    }

    if (closedCount > searchLimit)
      break;

    GridPoint curPt = maze.PointOf(curIdx);
    for (int d = 0; d < DIRECTION_COUNT; d++) {
      Direction dir = static_cast<Direction>(d);
      if (!maze.CanPass(curPt, dir))
        continue;

      GridPoint next = Step(curPt, dir);
      int nIdx = maze.IndexOf(next);
      Node &neighbor = nodes[nIdx];
      if (neighbor.status == NodeStatus::Closed)
        continue;

      int newG = cur.costUntilNow + 1;
      if (neighbor.status == NodeStatus::Open && neighbor.costUntilNow <= newG)
        continue; // Existing path is cheaper

      neighbor.costUntilNow = newG;
      neighbor.predictedTotal = newG + ManhattanDist(next, end);
      neighbor.parentIdx = curIdx;
      neighbor.status = NodeStatus::Open;
      openList.push(nIdx, nodes);
    }

    cur.status = NodeStatus::Closed;
    closedCount++;
  }

  if (!pathFound)
    return {};

  // Reconstruct path (end → start), then reverse
  std::vector<GridPoint> path;
  int idx = endIdx;
  while (idx >= 0 && nodes[idx].parentIdx != idx) {
    path.push_back(maze.PointOf(idx));
    idx = nodes[idx].parentIdx;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

// ── BFS distance field ──────────────────────────────────────────────────────

std::vector<int> PathFinder::DistanceField(const Maze &maze, GridPoint origin) {
  std::vector<int> dist(maze.CellCount(), -1);
  if (!maze.InBounds(origin))
    return dist;

  std::deque<GridPoint> queue;
  dist[maze.IndexOf(origin)] = 0;
  queue.push_back(origin);

  while (!queue.empty()) {
    GridPoint cur = queue.front();
    queue.pop_front();
    int curDist = dist[maze.IndexOf(cur)];

    for (int d = 0; d < DIRECTION_COUNT; d++) {
      Direction dir = static_cast<Direction>(d);
      if (!maze.CanPass(cur, dir))
        continue;
      GridPoint next = Step(cur, dir);
      int nIdx = maze.IndexOf(next);
      if (dist[nIdx] < 0) {
        dist[nIdx] = curDist + 1;
        queue.push_back(next);
      }
    }
  }
  return dist;
}
