#ifndef POINT_H
#define POINT_H

struct Point {
	int x;
	int y;
	bool operator==(const Point &p) const
	{
		return x == p.x && y == p.y;
	}
	bool operator!=(const Point &p) const
	{
		return !(*this == p);
	}
};

#endif
